#ifndef STRATA_SCHEDULE_HPP
#define STRATA_SCHEDULE_HPP
/*
 * Stage / fade-in controller.
 * ---------------------------------------------------------------------------
 * Drives the three progressive networks of a training context through a
 * stage, one tick at a time:
 *
 *   stage == 1                 Base     alpha 0, never touches topology
 *   stage  > 1, tick == 0      Growing  grow all three, rebind optimizers
 *   stage  > 1, 0 < t < T      Growing  alpha += 1/T on all three
 *   stage  > 1, tick == T      Stable   flush all three, rebind optimizers
 *   anything else                       no-op, last alpha
 *
 * T (`tickers`) is fixed at construction and shared by every stage, even
 * though later stages run for more epochs than the first; the fade-in then
 * completes part way through those stages and the remainder trains Stable.
 */

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "../network/progressive.hpp"
#include "../optimizer/optimizer.hpp"
#include "../training/context.hpp"
#include "../utils/terminal.hpp"

namespace Strata::Schedule {

    [[nodiscard]] inline std::int64_t total_stages(std::int64_t init_size, std::int64_t size)
    {
        if (init_size <= 0 || size < init_size) {
            throw std::invalid_argument("total_stages requires 0 < init_size <= size.");
        }
        return static_cast<std::int64_t>(std::floor(std::log2(static_cast<double>(size) / static_cast<double>(init_size)))) + 1;
    }

    [[nodiscard]] inline std::int64_t resolution_at(std::int64_t init_size, std::int64_t stage)
    {
        return init_size << (stage - 1);
    }

    // Higher resolutions get more stabilisation time: 1x, 2x for stages 2-4, 3x beyond.
    [[nodiscard]] inline std::int64_t epochs_for_stage(std::int64_t unit_epoch, std::int64_t stage)
    {
        if (stage == 1) return unit_epoch;
        if (stage <= 4) return unit_epoch * 2;
        return unit_epoch * 3;
    }

    [[nodiscard]] inline std::int64_t ticks_per_stage(std::int64_t unit_epoch, std::int64_t num_aug, std::int64_t batches_per_epoch)
    {
        return unit_epoch * num_aug * batches_per_epoch;
    }

    struct Transition {
        Network::Mode state{Network::Mode::Base};
        double alpha{0.0};
        bool rebound{false};
        Optimizer::RebindReport generator{};
        Optimizer::RebindReport discriminator{};
    };

    class Controller {
    public:
        Controller(std::int64_t init_size, std::int64_t size, std::int64_t tickers)
            : total_stages_(total_stages(init_size, size)), tickers_(tickers)
        {
            if (tickers_ <= 0) {
                throw std::invalid_argument("Controller needs a positive tick budget per stage (got "
                                            + std::to_string(tickers_) + ").");
            }
            delta_ = 1.0 / static_cast<double>(tickers_);
        }

        // Returns the alpha the real batch of this tick has to be blended with.
        double update(Training::Context& context, std::int64_t stage, std::int64_t tick)
        {
            if (stage < 1 || stage > total_stages_) {
                throw std::out_of_range("Invalid stage number " + std::to_string(stage) + "; valid stages are 1.."
                                        + std::to_string(total_stages_) + ".");
            }

            last_ = Transition{};
            if (stage == 1) {
                state_ = Network::Mode::Base;
                alpha_ = 0.0;
                last_.state = state_;
                last_.alpha = alpha_;
                return alpha_;
            }

            auto& generator = *context.generator;
            auto& discriminator = *context.discriminator;
            auto& shadow = context.shadow;

            if (tick == 0) {
                generator.grow_network();
                discriminator.grow_network();
                shadow.grow_network();
                rebind(context);
                state_ = Network::Mode::Growing;
            } else if (tick > 0 && tick < tickers_) {
                generator.update_alpha(delta_);
                discriminator.update_alpha(delta_);
                shadow.update_alpha(delta_);
            } else if (tick == tickers_) {
                generator.flush_network();
                discriminator.flush_network();
                shadow.flush_network();
                rebind(context);
                state_ = Network::Mode::Stable;
            } else {
                last_.state = state_;
                last_.alpha = alpha_;
                return alpha_;
            }

            ensure_in_step(generator, discriminator, shadow);
            alpha_ = state_ == Network::Mode::Growing ? generator.alpha() : 1.0;
            last_.state = state_;
            last_.alpha = alpha_;
            return alpha_;
        }

        [[nodiscard]] Network::Mode state() const noexcept { return state_; }
        [[nodiscard]] double alpha() const noexcept { return alpha_; }
        [[nodiscard]] double delta() const noexcept { return delta_; }
        [[nodiscard]] std::int64_t tickers() const noexcept { return tickers_; }
        [[nodiscard]] std::int64_t total_stages() const noexcept { return total_stages_; }
        [[nodiscard]] const Transition& last_transition() const noexcept { return last_; }

    private:
        void rebind(Training::Context& context)
        {
            context.relocate();
            last_.rebound = true;
            last_.generator = context.generator_optimizer.rebind(context.generator->parameters());
            last_.discriminator = context.discriminator_optimizer.rebind(context.discriminator->parameters());

            auto describe = [](const Optimizer::RebindReport& report) {
                return std::to_string(report.carried) + " carried, " + std::to_string(report.dropped) + " dropped, "
                       + std::to_string(report.fresh) + " fresh";
            };
            Utils::Terminal::Info(context.stream, "optimizer rebind  G: " + describe(last_.generator)
                                                      + "  D: " + describe(last_.discriminator));
        }

        static void ensure_in_step(const Network::Progressive& generator,
                                   const Network::Progressive& discriminator,
                                   const Network::Progressive& shadow)
        {
            const bool aligned = generator.stage() == discriminator.stage() && generator.stage() == shadow.stage()
                                 && generator.mode() == discriminator.mode() && generator.mode() == shadow.mode();
            if (!aligned) {
                throw std::logic_error("Generator, discriminator and EMA shadow left the same stage/fade-in state.");
            }
        }

        std::int64_t total_stages_;
        std::int64_t tickers_;
        double delta_{0.0};
        Network::Mode state_{Network::Mode::Base};
        double alpha_{0.0};
        Transition last_{};
    };
}

#endif // STRATA_SCHEDULE_HPP
