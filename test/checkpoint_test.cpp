#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

using namespace Strata;

namespace {
    Common::Checkpoint::Blueprint tiny_blueprint(std::int64_t size)
    {
        Common::Checkpoint::Blueprint blueprint{};
        blueprint.generator = Testing::tiny_generator(size);
        blueprint.discriminator = Testing::tiny_discriminator(size);
        return blueprint;
    }

    // One optimisation step on both networks so the Adam state is populated.
    void train_once(Testing::Rig& rig, std::int64_t resolution)
    {
        auto context = rig.context();
        Training::AdversarialOptions options{};
        options.latent_dim = 8;
        Training::adversarial_step(context, torch::rand({2, 3, resolution, resolution}), options);
        rig.shadow->update(rig.generator, 0.5);
    }

    void expect_same_parameters(torch::nn::Module& expected, torch::nn::Module& actual)
    {
        auto actual_parameters = actual.named_parameters(/*recurse=*/true);
        ASSERT_EQ(expected.named_parameters(true).size(), actual_parameters.size());
        for (const auto& item : expected.named_parameters(/*recurse=*/true)) {
            const auto* found = actual_parameters.find(item.key());
            ASSERT_NE(found, nullptr) << item.key();
            EXPECT_TRUE(torch::equal(item.value().detach(), found->detach())) << item.key();
        }
    }
}

TEST(Checkpoint, ArchiveCarriesEveryComponent)
{
    torch::manual_seed(1);
    Testing::ScratchDirectory scratch("strata_checkpoint_keys");
    Testing::Rig rig(8);
    train_once(rig, 4);
    auto context = rig.context();
    const auto path = Common::Checkpoint::save(scratch.path(), 1, context);
    EXPECT_EQ(path, scratch.path() / "stage1.pt");
    EXPECT_FALSE(std::filesystem::exists(scratch.path() / "stage1.pt.tmp"));

    torch::serialize::InputArchive archive;
    archive.load_from(path.string());
    auto keys = archive.keys();
    std::sort(keys.begin(), keys.end());
    const std::vector<std::string> expected{"discriminator", "generator", "generator_ema",
                                            "optimizer_discriminator", "optimizer_generator",
                                            "resolution", "stage"};
    EXPECT_EQ(keys, expected);
    EXPECT_EQ(std::count_if(keys.begin(), keys.end(), [](const std::string& key) { return key.rfind("optimizer_", 0) == 0; }), 2);
}

TEST(Checkpoint, LoadRestoresTheFinalStageExactly)
{
    torch::manual_seed(2);
    Testing::ScratchDirectory scratch("strata_checkpoint_restore");
    Testing::Rig rig(8);
    auto context = rig.context();
    Schedule::Controller controller(4, 8, 2);
    train_once(rig, 4);
    controller.update(context, 2, 0);
    train_once(rig, 8);
    controller.update(context, 2, 1);
    controller.update(context, 2, 2);
    train_once(rig, 8);
    ASSERT_EQ(rig.generator->mode(), Network::Mode::Stable);

    const auto path = Common::Checkpoint::save(scratch.path(), 2, context);
    auto restored = Common::Checkpoint::load(path, tiny_blueprint(8), 2);

    EXPECT_EQ(restored.stage, 2);
    EXPECT_EQ(restored.generator->resolution(), 8);
    EXPECT_EQ(restored.generator->mode(), Network::Mode::Stable);
    EXPECT_EQ(restored.discriminator->resolution(), 8);
    EXPECT_EQ(Testing::parameter_names(*restored.generator),
              Testing::parameter_names(*restored.shadow->network()));

    expect_same_parameters(*rig.generator, *restored.generator);
    expect_same_parameters(*rig.discriminator, *restored.discriminator);
    expect_same_parameters(*rig.shadow->network(), *restored.shadow->network());

    const auto live = rig.generator->named_parameters()["to_rgb_8.weight"];
    const auto copy = restored.generator->named_parameters()["to_rgb_8.weight"];
    const auto* live_state = rig.generator_optimizer->state_of(live);
    const auto* restored_state = restored.generator_optimizer->state_of(copy);
    ASSERT_NE(live_state, nullptr);
    ASSERT_NE(restored_state, nullptr);
    EXPECT_EQ(live_state->step(), restored_state->step());
    EXPECT_TRUE(torch::equal(live_state->exp_avg(), restored_state->exp_avg()));
}

TEST(Checkpoint, GarbageFilesAreRejected)
{
    Testing::ScratchDirectory scratch("strata_checkpoint_garbage");
    const auto path = scratch.path() / "stage1.pt";
    std::ofstream(path) << "definitely not a torch archive";
    EXPECT_THROW(Common::Checkpoint::load(path, tiny_blueprint(8), 2), std::runtime_error);
    EXPECT_THROW(Common::Checkpoint::load(scratch.path() / "absent.pt", tiny_blueprint(8), 2), std::runtime_error);
}

TEST(Checkpoint, PartialArchivesAreRejected)
{
    Testing::ScratchDirectory scratch("strata_checkpoint_partial");
    const auto path = scratch.path() / "stage1.pt";
    torch::serialize::OutputArchive archive;
    archive.write("stage", c10::IValue(std::int64_t{1}));
    archive.write("resolution", c10::IValue(std::int64_t{4}));
    archive.save_to(path.string());
    EXPECT_THROW(Common::Checkpoint::load(path, tiny_blueprint(8), 2), std::runtime_error);
}

TEST(Checkpoint, StagesOutsideTheCurriculumAreRejected)
{
    Testing::ScratchDirectory scratch("strata_checkpoint_stage");
    const auto path = scratch.path() / "stage9.pt";
    torch::serialize::OutputArchive archive;
    archive.write("stage", c10::IValue(std::int64_t{9}));
    archive.write("resolution", c10::IValue(std::int64_t{1024}));
    archive.save_to(path.string());
    EXPECT_THROW(Common::Checkpoint::load(path, tiny_blueprint(8), 2), std::runtime_error);
}

TEST(Checkpoint, ShapeMismatchesAreRejected)
{
    Testing::ScratchDirectory scratch("strata_checkpoint_shape");
    Testing::Rig rig(8);
    auto context = rig.context();
    const auto path = Common::Checkpoint::save(scratch.path(), 1, context);

    auto narrower = tiny_blueprint(8);
    narrower.generator.fmap_base = 16;
    narrower.discriminator.fmap_base = 16;
    EXPECT_THROW(Common::Checkpoint::load(path, narrower, 2), std::runtime_error);
}

TEST(Checkpoint, FailedResumeLeavesTheTrainerUntouched)
{
    Testing::ScratchDirectory scratch("strata_checkpoint_trainer");
    std::ostringstream log;
    Core::Trainer trainer(Testing::tiny_run(scratch.path(), log),
                          std::make_unique<Data::TensorSource>(torch::rand({4, 3, 8, 8}), 2),
                          std::make_unique<Testing::RecordingSink>());

    const auto* generator = trainer.generator().get();
    const auto* optimizer = &trainer.generator_optimizer();
    const auto before = trainer.generator()->named_parameters()["to_rgb_4.weight"].detach().clone();

    const auto garbage = scratch.path() / "stage1.pt";
    std::ofstream(garbage) << "garbage";
    EXPECT_THROW(trainer.resume(garbage), std::runtime_error);

    EXPECT_EQ(trainer.generator().get(), generator);
    EXPECT_EQ(&trainer.generator_optimizer(), optimizer);
    EXPECT_EQ(trainer.first_stage(), 1);
    EXPECT_TRUE(torch::equal(trainer.generator()->named_parameters()["to_rgb_4.weight"].detach(), before));
}
