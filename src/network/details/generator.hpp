#ifndef STRATA_NETWORK_DETAILS_GENERATOR_HPP
#define STRATA_NETWORK_DETAILS_GENERATOR_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../progressive.hpp"
#include "layers.hpp"

namespace Strata::Network::Details {

    struct GeneratorOptions {
        std::int64_t channels{3};
        std::int64_t latent_dim{512};
        std::int64_t init_size{4};
        std::int64_t size{256};
        std::int64_t fmap_base{4096};
        std::int64_t fmap_max{256};
    };

    // Submodules are registered under resolution-keyed names (block_8, to_rgb_8, ...) so that a
    // parameter keeps both its name and its tensor identity for as long as it is part of the graph.
    class GeneratorImpl : public torch::nn::Module, public Progressive {
    public:
        explicit GeneratorImpl(GeneratorOptions options) : options_(options), resolution_(options.init_size)
        {
            if (options_.size < options_.init_size) {
                throw std::invalid_argument("Generator final size must not be smaller than its initial size.");
            }
            stem_ = register_module(block_name(resolution_),
                                    GeneratorStem(options_.latent_dim, channels_at(resolution_), options_.init_size));
            to_rgb_.emplace(resolution_, register_module(head_name(resolution_), make_to_rgb(resolution_)));
        }

        void grow_network() override
        {
            if (resolution_ >= options_.size) {
                throw std::logic_error("Generator is already at its final resolution " + std::to_string(options_.size)
                                       + "; it cannot grow further.");
            }
            fade_.open("Generator");

            const auto device = device_of(*this);
            const auto next = resolution_ * 2;
            auto block = UpBlock(channels_at(resolution_), channels_at(next));
            block->to(device);
            blocks_.push_back(register_module(block_name(next), block));

            auto head = make_to_rgb(next);
            head->to(device);
            to_rgb_.emplace(next, register_module(head_name(next), head));

            previous_resolution_ = resolution_;
            resolution_ = next;
        }

        void update_alpha(double delta) override
        {
            fade_.update(delta, "Generator");
        }

        void flush_network() override
        {
            fade_.close("Generator");
            unregister_module(head_name(previous_resolution_));
            to_rgb_.erase(previous_resolution_);
        }

        [[nodiscard]] Mode mode() const override { return fade_.mode(); }
        [[nodiscard]] double alpha() const override { return fade_.alpha(); }
        [[nodiscard]] std::int64_t resolution() const override { return resolution_; }
        [[nodiscard]] std::int64_t stage() const override { return static_cast<std::int64_t>(blocks_.size()) + 1; }
        [[nodiscard]] const GeneratorOptions& options() const noexcept { return options_; }

        // Replays a peer's grow/flush history and fade state onto this (freshly built) network.
        void match_topology(const Progressive& peer)
        {
            if (stage() != 1 || mode() != Mode::Base) {
                throw std::logic_error("Generator::match_topology requires a freshly constructed network.");
            }
            for (std::int64_t s = 1; s < peer.stage(); ++s) {
                grow_network();
                const bool last = (s + 1 == peer.stage());
                if (!(last && peer.mode() == Mode::Growing)) {
                    flush_network();
                }
            }
            fade_.assign(peer.mode(), peer.alpha());
        }

        torch::Tensor forward(torch::Tensor z) override
        {
            auto x = stem_->forward(std::move(z));
            if (fade_.mode() != Mode::Growing) {
                for (auto& block : blocks_) {
                    x = block->forward(x);
                }
                return to_rgb_.at(resolution_)->forward(x);
            }

            for (std::size_t i = 0; i + 1 < blocks_.size(); ++i) {
                x = blocks_[i]->forward(x);
            }
            auto previous = upsample2x(to_rgb_.at(previous_resolution_)->forward(x));
            auto current = to_rgb_.at(resolution_)->forward(blocks_.back()->forward(x));
            return fade_.blend(previous, current);
        }

    private:
        [[nodiscard]] std::int64_t channels_at(std::int64_t resolution) const
        {
            return Details::channels_at(resolution, options_.fmap_base, options_.fmap_max);
        }

        [[nodiscard]] torch::nn::Conv2d make_to_rgb(std::int64_t resolution) const
        {
            torch::nn::Conv2d head(torch::nn::Conv2dOptions(channels_at(resolution), options_.channels, 1));
            Initialization::Details::apply_module_initialization(head, Initialization::XavierNormal);
            return head;
        }

        static std::string block_name(std::int64_t resolution) { return "block_" + std::to_string(resolution); }
        static std::string head_name(std::int64_t resolution) { return "to_rgb_" + std::to_string(resolution); }

        GeneratorOptions options_;
        std::int64_t resolution_;
        std::int64_t previous_resolution_{0};
        FadeIn fade_{};

        GeneratorStem stem_{nullptr};
        std::vector<UpBlock> blocks_{};
        std::map<std::int64_t, torch::nn::Conv2d> to_rgb_{};
    };
    TORCH_MODULE(Generator);
}

#endif // STRATA_NETWORK_DETAILS_GENERATOR_HPP
