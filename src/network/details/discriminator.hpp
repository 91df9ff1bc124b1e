#ifndef STRATA_NETWORK_DETAILS_DISCRIMINATOR_HPP
#define STRATA_NETWORK_DETAILS_DISCRIMINATOR_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../progressive.hpp"
#include "layers.hpp"

namespace Strata::Network::Details {

    struct DiscriminatorOptions {
        std::int64_t channels{3};
        std::int64_t init_size{4};
        std::int64_t size{256};
        std::int64_t fmap_base{4096};
        std::int64_t fmap_max{256};
    };

    // Mirror image of the generator: from_rgb_<R> heads feed down blocks that halve the
    // resolution until the critic head at init_size. Growth prepends a block at the input side.
    class DiscriminatorImpl : public torch::nn::Module, public Progressive {
    public:
        explicit DiscriminatorImpl(DiscriminatorOptions options) : options_(options), resolution_(options.init_size)
        {
            if (options_.size < options_.init_size) {
                throw std::invalid_argument("Discriminator final size must not be smaller than its initial size.");
            }
            head_ = register_module("critic_" + std::to_string(resolution_),
                                    CriticHead(channels_at(resolution_), options_.init_size));
            from_rgb_.emplace(resolution_, register_module(input_name(resolution_), make_from_rgb(resolution_)));
        }

        void grow_network() override
        {
            if (resolution_ >= options_.size) {
                throw std::logic_error("Discriminator is already at its final resolution " + std::to_string(options_.size)
                                       + "; it cannot grow further.");
            }
            fade_.open("Discriminator");

            const auto device = device_of(*this);
            const auto next = resolution_ * 2;
            auto block = DownBlock(channels_at(next), channels_at(resolution_));
            block->to(device);
            blocks_.push_back(register_module(block_name(next), block));

            auto input = make_from_rgb(next);
            input->to(device);
            from_rgb_.emplace(next, register_module(input_name(next), input));

            previous_resolution_ = resolution_;
            resolution_ = next;
        }

        void update_alpha(double delta) override
        {
            fade_.update(delta, "Discriminator");
        }

        void flush_network() override
        {
            fade_.close("Discriminator");
            unregister_module(input_name(previous_resolution_));
            from_rgb_.erase(previous_resolution_);
        }

        [[nodiscard]] Mode mode() const override { return fade_.mode(); }
        [[nodiscard]] double alpha() const override { return fade_.alpha(); }
        [[nodiscard]] std::int64_t resolution() const override { return resolution_; }
        [[nodiscard]] std::int64_t stage() const override { return static_cast<std::int64_t>(blocks_.size()) + 1; }

        torch::Tensor forward(torch::Tensor x) override
        {
            if (x.size(-1) != resolution_ || x.size(-2) != resolution_) {
                throw std::invalid_argument("Discriminator expects " + std::to_string(resolution_) + "x"
                                            + std::to_string(resolution_) + " inputs, received "
                                            + std::to_string(x.size(-2)) + "x" + std::to_string(x.size(-1)) + ".");
            }

            torch::Tensor h;
            std::size_t remaining = blocks_.size();
            if (fade_.mode() == Mode::Growing) {
                auto current = blocks_.back()->forward(leaky(from_rgb_.at(resolution_)->forward(x)));
                auto previous = leaky(from_rgb_.at(previous_resolution_)->forward(downsample2x(x)));
                h = fade_.blend(previous, current);
                --remaining;
            } else {
                h = leaky(from_rgb_.at(resolution_)->forward(x));
            }

            // blocks_ is ordered by growth (lowest resolution first); walk it from the input side.
            for (std::size_t i = remaining; i-- > 0;) {
                h = blocks_[i]->forward(h);
            }
            return head_->forward(h);
        }

    private:
        [[nodiscard]] std::int64_t channels_at(std::int64_t resolution) const
        {
            return Details::channels_at(resolution, options_.fmap_base, options_.fmap_max);
        }

        [[nodiscard]] torch::nn::Conv2d make_from_rgb(std::int64_t resolution) const
        {
            return make_conv(options_.channels, channels_at(resolution), 1, 0);
        }

        static std::string block_name(std::int64_t resolution) { return "block_" + std::to_string(resolution); }
        static std::string input_name(std::int64_t resolution) { return "from_rgb_" + std::to_string(resolution); }

        DiscriminatorOptions options_;
        std::int64_t resolution_;
        std::int64_t previous_resolution_{0};
        FadeIn fade_{};

        CriticHead head_{nullptr};
        std::vector<DownBlock> blocks_{};
        std::map<std::int64_t, torch::nn::Conv2d> from_rgb_{};
    };
    TORCH_MODULE(Discriminator);
}

#endif // STRATA_NETWORK_DETAILS_DISCRIMINATOR_HPP
