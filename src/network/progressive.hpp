#ifndef STRATA_NETWORK_PROGRESSIVE_HPP
#define STRATA_NETWORK_PROGRESSIVE_HPP
/*
 * Progressive network contract.
 * ---------------------------------------------------------------------------
 *  - `Progressive` is the interface the stage controller drives. Generator,
 *    discriminator and the EMA shadow all implement it, so growth and fade-in
 *    never reach into a concrete network's internals.
 *  - A network is in one of three modes:
 *      Base    : never grown, only the initial resolution path exists.
 *      Growing : a new resolution block was appended and is blended with the
 *                previous output path by `alpha`.
 *      Stable  : the blend was collapsed, only the newest path remains.
 *  - `alpha()` is only meaningful in Growing. Base and Stable report 1
 *    (fully grown, nothing to blend).
 *  - Growth and flush change the parameter set. Any optimizer bound to the
 *    previous set is stale afterwards and has to be rebound.
 */

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

namespace Strata::Network {

    enum class Mode {
        Base,
        Growing,
        Stable
    };

    [[nodiscard]] inline std::string_view to_string(Mode mode) noexcept
    {
        switch (mode) {
            case Mode::Base: return "base";
            case Mode::Growing: return "growing";
            case Mode::Stable: return "stable";
        }
        return "unknown";
    }

    class Progressive {
    public:
        virtual ~Progressive() = default;

        virtual void grow_network() = 0;
        virtual void update_alpha(double delta) = 0;
        virtual void flush_network() = 0;

        [[nodiscard]] virtual Mode mode() const = 0;
        [[nodiscard]] virtual double alpha() const = 0;
        [[nodiscard]] virtual std::int64_t resolution() const = 0;
        [[nodiscard]] virtual std::int64_t stage() const = 0;

        virtual torch::Tensor forward(torch::Tensor input) = 0;
    };

    namespace Details {
        // Blend bookkeeping shared by every progressive network.
        class FadeIn {
        public:
            void open(std::string_view owner)
            {
                if (mode_ == Mode::Growing) {
                    throw std::logic_error(std::string(owner) + ": cannot grow while a fade-in is still open; flush first.");
                }
                mode_ = Mode::Growing;
                alpha_ = 0.0;
            }

            void update(double delta, std::string_view owner)
            {
                if (mode_ != Mode::Growing) {
                    throw std::logic_error(std::string(owner) + ": update_alpha requires an open fade-in (mode is "
                                           + std::string(to_string(mode_)) + ").");
                }
                alpha_ = std::min(1.0, alpha_ + delta);
            }

            void close(std::string_view owner)
            {
                if (mode_ != Mode::Growing) {
                    throw std::logic_error(std::string(owner) + ": flush requires an open fade-in (mode is "
                                           + std::string(to_string(mode_)) + ").");
                }
                mode_ = Mode::Stable;
                alpha_ = 1.0;
            }

            // Restores a state read back from a peer network (EMA replay).
            void assign(Mode mode, double alpha) noexcept
            {
                mode_ = mode;
                alpha_ = mode == Mode::Growing ? std::clamp(alpha, 0.0, 1.0) : 1.0;
            }

            [[nodiscard]] Mode mode() const noexcept { return mode_; }
            [[nodiscard]] double alpha() const noexcept { return mode_ == Mode::Growing ? alpha_ : 1.0; }

            [[nodiscard]] torch::Tensor blend(const torch::Tensor& previous, const torch::Tensor& current) const
            {
                return previous.mul(1.0 - alpha_) + current.mul(alpha_);
            }

        private:
            Mode mode_{Mode::Base};
            double alpha_{1.0};
        };

        [[nodiscard]] inline std::int64_t channels_at(std::int64_t resolution, std::int64_t fmap_base, std::int64_t fmap_max)
        {
            return std::clamp<std::int64_t>(fmap_base / resolution, 1, fmap_max);
        }

        [[nodiscard]] inline torch::Device device_of(torch::nn::Module& module)
        {
            const auto parameters = module.parameters();
            return parameters.empty() ? torch::Device(torch::kCPU) : parameters.front().device();
        }
    }
}

#endif // STRATA_NETWORK_PROGRESSIVE_HPP
