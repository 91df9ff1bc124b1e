#ifndef STRATA_EMA_HPP
#define STRATA_EMA_HPP
/*
 * Exponential moving-average shadow of the generator.
 * ---------------------------------------------------------------------------
 *  - Owns an independent Generator built from the live generator's options,
 *    replayed to the live topology, frozen, and parked on its own device.
 *  - Follows every grow / update_alpha / flush the live generator goes
 *    through, so parameter names stay in one-to-one correspondence.
 *  - `update` blends W_ema <- decay * W_ema + (1 - decay) * W_live by name.
 *    A name without a live counterpart means the two topologies drifted
 *    apart; that is a bug, reported as std::logic_error.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../network/network.hpp"

namespace Strata::EMA {

    inline constexpr double kDefaultDecay = 0.999;

    class Shadow : public Network::Progressive {
    public:
        Shadow(const Network::Generator& live, torch::Device device)
            : device_(device), network_(live->options())
        {
            network_->match_topology(*live);
            freeze();
            update(live, 0.0);
        }

        void grow_network() override
        {
            network_->grow_network();
            freeze();
        }

        void update_alpha(double delta) override { network_->update_alpha(delta); }

        void flush_network() override
        {
            network_->flush_network();
            freeze();
        }

        [[nodiscard]] Network::Mode mode() const override { return network_->mode(); }
        [[nodiscard]] double alpha() const override { return network_->alpha(); }
        [[nodiscard]] std::int64_t resolution() const override { return network_->resolution(); }
        [[nodiscard]] std::int64_t stage() const override { return network_->stage(); }

        // Inference only: eval mode, no autograd, latent moved to the shadow device.
        torch::Tensor forward(torch::Tensor z) override
        {
            torch::NoGradGuard no_grad;
            network_->eval();
            return network_->forward(z.to(device_));
        }

        void update(const Network::Generator& live, double decay = kDefaultDecay)
        {
            torch::NoGradGuard no_grad;
            auto live_parameters = live->named_parameters(/*recurse=*/true);
            auto shadow_parameters = network_->named_parameters(/*recurse=*/true);

            if (live_parameters.size() != shadow_parameters.size()) {
                throw std::logic_error("EMA shadow holds " + std::to_string(shadow_parameters.size())
                                       + " parameters but the generator holds " + std::to_string(live_parameters.size())
                                       + "; topologies are out of sync.");
            }

            for (auto& item : shadow_parameters) {
                const auto* source = live_parameters.find(item.key());
                if (source == nullptr) {
                    throw std::logic_error("EMA shadow parameter '" + item.key()
                                           + "' has no counterpart in the generator; topologies are out of sync.");
                }
                auto& target = item.value();
                auto incoming = source->detach().to(target.device(), torch::kFloat32);
                target.copy_(target.mul(decay) + incoming.mul(1.0 - decay));
            }
        }

        void to(torch::Device device)
        {
            device_ = device;
            network_->to(device_);
        }

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }
        [[nodiscard]] Network::Generator& network() noexcept { return network_; }
        [[nodiscard]] const Network::Generator& network() const noexcept { return network_; }

    private:
        void freeze()
        {
            network_->to(device_);
            for (auto& parameter : network_->parameters()) {
                parameter.set_requires_grad(false);
            }
        }

        torch::Device device_;
        Network::Generator network_;
    };
}

#endif // STRATA_EMA_HPP
