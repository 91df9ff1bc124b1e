#include <stdexcept>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

using namespace Strata;

TEST(Curriculum, StageCountAndEpochMultipliers)
{
    EXPECT_EQ(Schedule::total_stages(4, 4), 1);
    EXPECT_EQ(Schedule::total_stages(4, 8), 2);
    EXPECT_EQ(Schedule::total_stages(4, 256), 7);
    EXPECT_EQ(Schedule::resolution_at(4, 3), 16);

    EXPECT_EQ(Schedule::epochs_for_stage(10, 1), 10);
    EXPECT_EQ(Schedule::epochs_for_stage(10, 2), 20);
    EXPECT_EQ(Schedule::epochs_for_stage(10, 4), 20);
    EXPECT_EQ(Schedule::epochs_for_stage(10, 5), 30);
    EXPECT_EQ(Schedule::ticks_per_stage(10, 2, 7), 140);
}

TEST(Controller, RejectsAnEmptyTickBudget)
{
    EXPECT_THROW(Schedule::Controller(4, 16, 0), std::invalid_argument);
}

TEST(Controller, StageOutsideTheCurriculumThrows)
{
    Testing::Rig rig;
    auto context = rig.context();
    Schedule::Controller controller(4, 16, 4);
    EXPECT_THROW(controller.update(context, 0, 0), std::out_of_range);
    EXPECT_THROW(controller.update(context, 4, 0), std::out_of_range);
}

TEST(Controller, StageOneIsAlwaysAlphaZeroWithoutSideEffects)
{
    Testing::Rig rig;
    auto context = rig.context();
    Schedule::Controller controller(4, 16, 4);

    const auto generator_count = Testing::trainable_count(*rig.generator);
    const auto discriminator_count = Testing::trainable_count(*rig.discriminator);
    const auto* optimizer = &rig.generator_optimizer->get();

    for (const std::int64_t tick : {0, 1, 3, 4, 5, 1000}) {
        EXPECT_EQ(controller.update(context, 1, tick), 0.0);
        EXPECT_EQ(controller.state(), Network::Mode::Base);
        EXPECT_FALSE(controller.last_transition().rebound);
    }
    EXPECT_EQ(rig.generator->stage(), 1);
    EXPECT_EQ(rig.discriminator->stage(), 1);
    EXPECT_EQ(rig.shadow->stage(), 1);
    EXPECT_EQ(Testing::trainable_count(*rig.generator), generator_count);
    EXPECT_EQ(Testing::trainable_count(*rig.discriminator), discriminator_count);
    EXPECT_EQ(&rig.generator_optimizer->get(), optimizer);
    EXPECT_TRUE(rig.log.str().empty());
}

TEST(Controller, FadeInFollowsTickOverTickers)
{
    Testing::Rig rig;
    auto context = rig.context();
    constexpr std::int64_t kTickers = 4;
    Schedule::Controller controller(4, 16, kTickers);

    const auto generator_before = Testing::trainable_count(*rig.generator);
    const auto discriminator_before = Testing::trainable_count(*rig.discriminator);

    EXPECT_EQ(controller.update(context, 2, 0), 0.0);
    EXPECT_EQ(controller.state(), Network::Mode::Growing);
    EXPECT_TRUE(controller.last_transition().rebound);
    EXPECT_EQ(rig.shadow->stage(), 2);

    const auto generator_grown = Testing::trainable_count(*rig.generator);
    const auto discriminator_grown = Testing::trainable_count(*rig.discriminator);
    EXPECT_GT(generator_grown, generator_before);
    EXPECT_GT(discriminator_grown, discriminator_before);
    EXPECT_EQ(rig.generator_optimizer->get().param_groups().front().params().size(), rig.generator->parameters().size());

    for (std::int64_t tick = 1; tick < kTickers; ++tick) {
        const double alpha = controller.update(context, 2, tick);
        EXPECT_NEAR(alpha, static_cast<double>(tick) / kTickers, 1e-12);
        EXPECT_NEAR(rig.discriminator->alpha(), alpha, 1e-12);
        EXPECT_NEAR(rig.shadow->alpha(), alpha, 1e-12);
    }

    EXPECT_EQ(controller.update(context, 2, kTickers), 1.0);
    EXPECT_EQ(controller.state(), Network::Mode::Stable);
    EXPECT_EQ(rig.generator->mode(), Network::Mode::Stable);
    EXPECT_LE(Testing::trainable_count(*rig.generator), generator_grown);
    EXPECT_LE(Testing::trainable_count(*rig.discriminator), discriminator_grown);
    EXPECT_EQ(rig.discriminator_optimizer->get().param_groups().front().params().size(),
              rig.discriminator->parameters().size());

    EXPECT_EQ(controller.update(context, 2, kTickers + 1), 1.0);
    EXPECT_FALSE(controller.last_transition().rebound);
    EXPECT_EQ(rig.generator->stage(), 2);
}

TEST(Controller, LogsEveryRebind)
{
    Testing::Rig rig;
    auto context = rig.context();
    Schedule::Controller controller(4, 16, 2);
    controller.update(context, 2, 0);
    controller.update(context, 2, 2);
    EXPECT_NE(rig.log.str().find("optimizer rebind"), std::string::npos);
}
