#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

using namespace Strata;

TEST(Grid, LaysImagesOutInPaddedRows)
{
    const auto grid = Monitor::make_grid(torch::rand({5, 3, 4, 4}));
    // two rows of up to four 4x4 cells, 2 px of padding around each
    EXPECT_EQ(grid.sizes(), (std::vector<std::int64_t>{3, 2 * 6 + 2, 4 * 6 + 2}));
    EXPECT_GE(grid.min().item<float>(), 0.0f);
    EXPECT_LE(grid.max().item<float>(), 1.0f);
    // The unused fifth..eighth cells keep the padding value.
    EXPECT_EQ(grid.narrow(1, 8, 4).narrow(2, 8, 4).abs().sum().item<float>(), 0.0f);
}

TEST(Grid, ExpandsGrayscaleAndRejectsEmptyBatches)
{
    const auto grid = Monitor::make_grid(torch::rand({2, 1, 4, 4}), Monitor::GridOptions{.nrow = 2, .padding = 0});
    EXPECT_EQ(grid.sizes(), (std::vector<std::int64_t>{3, 4, 8}));
    EXPECT_THROW(Monitor::make_grid(torch::rand({0, 3, 4, 4})), std::invalid_argument);
}

TEST(Sink, FileStemsFlattenTagHierarchies)
{
    EXPECT_EQ(Monitor::Details::file_stem("train/G_loss"), "train_G_loss");
    EXPECT_EQ(Monitor::Details::file_stem("alpha"), "alpha");
}

TEST(Sink, DirectorySinkWritesCsvSeriesAndImages)
{
    Testing::ScratchDirectory scratch("strata_sink");
    Monitor::DirectorySink sink(scratch.path(), /*keep_history=*/true);
    sink.add_scalar("train/D_loss", 1.5, 1);
    sink.add_scalar("train/D_loss", -0.25, 2);
    sink.add_image("stage_1/fake", Monitor::make_grid(torch::rand({4, 3, 4, 4})), 7);

    std::ifstream stream(scratch.path() / "scalars" / "train_D_loss.csv");
    std::stringstream contents;
    contents << stream.rdbuf();
    EXPECT_EQ(contents.str(), "step,value\n1,1.5\n2,-0.25\n");

    EXPECT_TRUE(std::filesystem::exists(scratch.path() / "images" / "stage_1_fake_7.png"));

    const auto& series = sink.history().at("train/D_loss");
    ASSERT_EQ(series.size(), 2U);
    EXPECT_EQ(series[1].first, 2);
    EXPECT_DOUBLE_EQ(series[1].second, -0.25);
}

TEST(Sink, HistoryIsOnlyKeptOnRequest)
{
    Testing::ScratchDirectory scratch("strata_sink_lean");
    Monitor::DirectorySink sink(scratch.path());
    for (std::int64_t step = 0; step < 100; ++step) {
        sink.add_scalar("archive/current_alpha", static_cast<double>(step) / 100.0, step);
    }
    EXPECT_FALSE(sink.keeps_history());
    EXPECT_TRUE(sink.history().empty());

    std::ifstream stream(scratch.path() / "scalars" / "archive_current_alpha.csv");
    std::string line;
    std::int64_t rows = 0;
    while (std::getline(stream, line)) {
        ++rows;
    }
    EXPECT_EQ(rows, 101);  // header + one row per step
}

TEST(Sink, ReopenedLogsAppendWithoutASecondHeader)
{
    Testing::ScratchDirectory scratch("strata_sink_reopen");
    {
        Monitor::DirectorySink sink(scratch.path());
        sink.add_scalar("train/G_loss", 1.0, 0);
    }
    Monitor::DirectorySink resumed(scratch.path());
    resumed.add_scalar("train/G_loss", 2.0, 1);

    std::ifstream stream(scratch.path() / "scalars" / "train_G_loss.csv");
    std::stringstream contents;
    contents << stream.rdbuf();
    EXPECT_EQ(contents.str(), "step,value\n0,1\n1,2\n");
}

TEST(Curves, NothingIsRenderedWithoutSamples)
{
    Testing::ScratchDirectory scratch("strata_curves");
    Monitor::History history;
    history["train/G_loss"] = {};
    EXPECT_FALSE(Monitor::render_curves(history, {"train/G_loss", "train/D_loss"}, scratch.path() / "losses.png"));
    EXPECT_FALSE(std::filesystem::exists(scratch.path() / "losses.png"));
}
