#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "support.hpp"

using namespace Strata;

namespace {
    void write(const std::filesystem::path& path, const char* text)
    {
        std::ofstream stream(path);
        stream << text;
    }
}

TEST(Config, DefaultsAreValid)
{
    EXPECT_NO_THROW(Config::validate(Config::Options{}));
}

TEST(Config, LoadsKnownKeysAndKeepsDefaultsForTheRest)
{
    Testing::ScratchDirectory scratch("strata_config");
    const auto path = scratch.path() / "run.json";
    write(path, R"({"size": 64, "batch_size": 8, "learning_rate": 0.0005, "dataset_root": "/data/faces",
                   "plot_curves": true, "seed": 17})");

    const auto options = Config::load_json(path);
    EXPECT_EQ(options.size, 64);
    EXPECT_EQ(options.batch_size, 8);
    EXPECT_DOUBLE_EQ(options.learning_rate, 0.0005);
    EXPECT_EQ(options.dataset_root, "/data/faces");
    EXPECT_TRUE(options.plot_curves);
    EXPECT_EQ(options.seed, 17U);
    EXPECT_EQ(options.init_size, 4);
    EXPECT_DOUBLE_EQ(options.ema_decay, 0.999);
}

TEST(Config, RejectsUnknownKeys)
{
    Testing::ScratchDirectory scratch("strata_config_unknown");
    const auto path = scratch.path() / "run.json";
    write(path, R"({"sise": 64})");
    EXPECT_THROW(Config::load_json(path), std::runtime_error);
}

TEST(Config, RejectsMalformedValues)
{
    Testing::ScratchDirectory scratch("strata_config_malformed");
    const auto path = scratch.path() / "run.json";
    write(path, R"({"batch_size": "many"})");
    EXPECT_THROW(Config::load_json(path), std::runtime_error);

    write(path, "{ not json");
    EXPECT_THROW(Config::load_json(path), std::runtime_error);
}

TEST(Config, ValidationGuardsTheCurriculum)
{
    Config::Options options{};
    options.size = 96;
    EXPECT_THROW(Config::validate(options), std::invalid_argument);

    options = Config::Options{};
    options.init_size = 2;
    EXPECT_THROW(Config::validate(options), std::invalid_argument);

    options = Config::Options{};
    options.size = 4;
    options.init_size = 8;
    EXPECT_THROW(Config::validate(options), std::invalid_argument);

    options = Config::Options{};
    options.ema_decay = 1.5;
    EXPECT_THROW(Config::validate(options), std::invalid_argument);
}

TEST(Config, SavedFilesLoadBack)
{
    Testing::ScratchDirectory scratch("strata_config_roundtrip");
    Config::Options options{};
    options.size = 32;
    options.latent_dim = 64;
    options.manifest = "faces.csv";
    options.shadow_device = "cpu";
    options.plot_curves = true;

    const auto path = scratch.path() / "config.json";
    Config::save_json(options, path);
    const auto restored = Config::load_json(path);
    EXPECT_EQ(restored.size, 32);
    EXPECT_EQ(restored.latent_dim, 64);
    EXPECT_EQ(restored.manifest, "faces.csv");
    EXPECT_TRUE(restored.plot_curves);
    EXPECT_DOUBLE_EQ(restored.drift_coefficient, options.drift_coefficient);
}
