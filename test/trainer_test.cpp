#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

using namespace Strata;

namespace {
    // Dotted names of every tensor stored below `archive`, one nested archive per submodule.
    std::set<std::string> tensor_names(torch::serialize::InputArchive& archive, const std::string& prefix = "")
    {
        std::set<std::string> names;
        for (const auto& key : archive.keys()) {
            torch::Tensor tensor;
            if (archive.try_read(key, tensor)) {
                names.insert(prefix + key);
                continue;
            }
            torch::serialize::InputArchive child;
            if (archive.try_read(key, child)) {
                for (const auto& name : tensor_names(child, prefix + key + ".")) {
                    names.insert(name);
                }
            }
        }
        return names;
    }

    struct Run {
        explicit Run(Config::Options options)
        {
            auto recording = std::make_unique<Testing::RecordingSink>();
            sink = recording.get();
            trainer = std::make_unique<Core::Trainer>(std::move(options),
                                                      std::make_unique<Data::TensorSource>(torch::rand({4, 3, 8, 8}), 2),
                                                      std::move(recording));
        }

        std::unique_ptr<Core::Trainer> trainer;
        Testing::RecordingSink* sink{nullptr};
    };
}

TEST(Trainer, RunsEveryStageAndCheckpointsEach)
{
    torch::manual_seed(3);
    Testing::ScratchDirectory scratch("strata_trainer_e2e");
    std::ostringstream log;
    Run run(Testing::tiny_run(scratch.path(), log));
    run.trainer->train();

    EXPECT_TRUE(std::filesystem::exists(scratch.path() / "stage1.pt"));
    EXPECT_TRUE(std::filesystem::exists(scratch.path() / "stage2.pt"));
    EXPECT_TRUE(std::filesystem::exists(scratch.path() / "config.json"));

    // The final stage-end checkpoint of this very run.
    torch::serialize::InputArchive archive;
    archive.load_from((scratch.path() / "stage2.pt").string());
    c10::IValue stage;
    ASSERT_TRUE(archive.try_read("stage", stage));
    ASSERT_TRUE(stage.isInt());
    EXPECT_EQ(stage.toInt(), 2);
    const auto keys = archive.keys();
    EXPECT_EQ(std::count_if(keys.begin(), keys.end(), [](const std::string& key) { return key.rfind("optimizer_", 0) == 0; }), 2);

    torch::serialize::InputArchive generator;
    torch::serialize::InputArchive shadow;
    ASSERT_TRUE(archive.try_read("generator", generator));
    ASSERT_TRUE(archive.try_read("generator_ema", shadow));
    const auto stored_names = tensor_names(generator);
    EXPECT_FALSE(stored_names.empty());
    EXPECT_EQ(stored_names, tensor_names(shadow));
    for (const auto& name : Testing::parameter_names(*run.trainer->generator())) {
        EXPECT_TRUE(stored_names.count(name)) << name;
    }

    const auto text = log.str();
    EXPECT_NE(text.find("[stage 1/2][epoch 1/1][aug 1/1][iter 1/2]"), std::string::npos);
    EXPECT_NE(text.find("[stage 2/2][epoch 2/2]"), std::string::npos);
    EXPECT_NE(text.find("optimizer rebind"), std::string::npos);

    auto& generator = run.trainer->generator();
    EXPECT_EQ(generator->resolution(), 8);
    EXPECT_EQ(generator->mode(), Network::Mode::Stable);
    EXPECT_EQ(run.trainer->discriminator()->resolution(), 8);
    EXPECT_EQ(run.trainer->shadow().stage(), 2);
    EXPECT_EQ(run.trainer->controller().state(), Network::Mode::Stable);

    // stage 1: 2 ticks; stage 2: 2 epochs x 2 batches
    EXPECT_EQ(run.trainer->global_step(), 6);
    const auto& alpha = run.sink->history().at("archive/current_alpha");
    ASSERT_EQ(alpha.size(), 6U);
    EXPECT_DOUBLE_EQ(alpha[0].second, 0.0);
    EXPECT_DOUBLE_EQ(alpha[1].second, 0.0);
    EXPECT_DOUBLE_EQ(alpha[2].second, 0.0);   // growth tick
    EXPECT_DOUBLE_EQ(alpha[3].second, 0.5);
    EXPECT_DOUBLE_EQ(alpha[4].second, 1.0);   // flush tick
    EXPECT_DOUBLE_EQ(alpha[5].second, 1.0);
    EXPECT_EQ(run.sink->history().at("train/D_loss").size(), 6U);

    // real and fake grids after every epoch: 1 in stage 1, 2 in stage 2
    EXPECT_EQ(run.sink->images.size(), 6U);
    const auto samples = run.trainer->shadow().forward(run.trainer->fixed_latent());
    EXPECT_EQ(samples.sizes(), (std::vector<std::int64_t>{2, 3, 8, 8}));
}

TEST(Trainer, ResumesAtTheStageAfterTheCheckpoint)
{
    torch::manual_seed(4);
    Testing::ScratchDirectory scratch("strata_trainer_resume");
    std::ostringstream first_log;
    {
        Run run(Testing::tiny_run(scratch.path(), first_log));
        run.trainer->train();
    }

    std::ostringstream log;
    auto options = Testing::tiny_run(scratch.path(), log);
    options.resume = (scratch.path() / "stage1.pt").string();
    Run run(options);
    EXPECT_EQ(run.trainer->first_stage(), 2);
    EXPECT_EQ(run.trainer->global_step(), 2);
    EXPECT_EQ(run.trainer->generator()->resolution(), 4);

    run.trainer->train();
    EXPECT_EQ(log.str().find("[stage 1/2]"), std::string::npos);
    EXPECT_NE(log.str().find("[stage 2/2]"), std::string::npos);
    EXPECT_EQ(run.trainer->generator()->resolution(), 8);
    EXPECT_EQ(run.trainer->global_step(), 6);
    EXPECT_EQ(run.sink->history().at("archive/current_alpha").front().first, 2);
}

TEST(Trainer, ResumingAFinishedRunIsANoOp)
{
    torch::manual_seed(5);
    Testing::ScratchDirectory scratch("strata_trainer_done");
    std::ostringstream first_log;
    {
        Run run(Testing::tiny_run(scratch.path(), first_log));
        run.trainer->train();
    }

    std::ostringstream log;
    auto options = Testing::tiny_run(scratch.path(), log);
    options.resume = (scratch.path() / "stage2.pt").string();
    Run run(options);
    EXPECT_EQ(run.trainer->first_stage(), 3);
    run.trainer->train();
    EXPECT_NE(log.str().find("all 2 stages already trained"), std::string::npos);
    EXPECT_TRUE(run.sink->history().empty());
}

TEST(Trainer, RequiresADataSource)
{
    Testing::ScratchDirectory scratch("strata_trainer_nodata");
    std::ostringstream log;
    EXPECT_THROW(Core::Trainer(Testing::tiny_run(scratch.path(), log)), std::invalid_argument);
}

TEST(Trainer, RejectsUnknownDevices)
{
    Testing::ScratchDirectory scratch("strata_trainer_device");
    std::ostringstream log;
    auto options = Testing::tiny_run(scratch.path(), log);
    options.device = "quantum:7";
    EXPECT_THROW(Core::Trainer(options, std::make_unique<Data::TensorSource>(torch::rand({4, 3, 8, 8}), 2)),
                 std::invalid_argument);
}

TEST(Trainer, DisplayCadenceFollowsTheEpochUnit)
{
    Testing::ScratchDirectory scratch("strata_trainer_cadence");
    std::ostringstream log;
    auto options = Testing::tiny_run(scratch.path(), log);
    options.unit_epoch = 20;
    Core::Trainer long_run(options, std::make_unique<Data::TensorSource>(torch::rand({4, 3, 8, 8}), 2),
                           std::make_unique<Testing::RecordingSink>());
    EXPECT_EQ(long_run.display_cadence(), 10);

    options.display_every = 3;
    Core::Trainer explicit_run(options, std::make_unique<Data::TensorSource>(torch::rand({4, 3, 8, 8}), 2),
                               std::make_unique<Testing::RecordingSink>());
    EXPECT_EQ(explicit_run.display_cadence(), 3);
}
