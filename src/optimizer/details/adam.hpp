#ifndef STRATA_OPTIMIZER_DETAILS_ADAM_HPP
#define STRATA_OPTIMIZER_DETAILS_ADAM_HPP
// Adam binding whose parameter set can be swapped under it.
// Growth and flush replace the trainable parameter list of a network; `rebind` rebuilds the
// optimizer on the new list and carries per-parameter moments for every tensor that survived.

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Strata::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.0};
        double beta2{0.99};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    struct RebindReport {
        std::size_t carried{0};  // retained parameters whose moments were migrated
        std::size_t dropped{0};  // state entries of parameters that left the network
        std::size_t fresh{0};    // parameters starting from empty moments
    };

    class AdamBinding {
    public:
        AdamBinding(std::vector<torch::Tensor> parameters, AdamOptions options)
            : options_(options),
              instance_(std::make_unique<torch::optim::Adam>(std::move(parameters), to_torch_options(options))) {}

        AdamBinding(AdamBinding&&) noexcept = default;
        AdamBinding& operator=(AdamBinding&&) noexcept = default;
        AdamBinding(const AdamBinding&) = delete;
        AdamBinding& operator=(const AdamBinding&) = delete;

        [[nodiscard]] torch::optim::Adam& get() { return *instance_; }
        [[nodiscard]] const torch::optim::Adam& get() const { return *instance_; }
        torch::optim::Adam* operator->() { return instance_.get(); }
        [[nodiscard]] const AdamOptions& options() const noexcept { return options_; }

        void zero_grad() { instance_->zero_grad(); }
        void step() { instance_->step(); }

        // Per-parameter state of `parameter`, or nullptr when it has none yet.
        [[nodiscard]] const torch::optim::AdamParamState* state_of(const torch::Tensor& parameter) const
        {
            const auto& state = instance_->state();
            const auto it = state.find(parameter.unsafeGetTensorImpl());
            if (it == state.end()) {
                return nullptr;
            }
            return static_cast<const torch::optim::AdamParamState*>(it->second.get());
        }

        // Identity is the TensorImpl address. A retained parameter whose impl was replaced
        // (rather than updated in place) is seen as new and restarts from zero moments.
        RebindReport rebind(std::vector<torch::Tensor> parameters)
        {
            RebindReport report{};
            auto& old_state = instance_->state();

            const auto& old_group = instance_->param_groups().front();
            auto group_options = old_group.options().clone();

            auto replacement = std::make_unique<torch::optim::Adam>(
                std::move(parameters), static_cast<const torch::optim::AdamOptions&>(*group_options));
            auto& new_state = replacement->state();

            std::size_t matched = 0;
            for (const auto& parameter : replacement->param_groups().front().params()) {
                auto* key = parameter.unsafeGetTensorImpl();
                const auto it = old_state.find(key);
                if (it == old_state.end()) {
                    ++report.fresh;
                    continue;
                }
                new_state[key] = it->second->clone();
                ++report.carried;
                ++matched;
            }
            report.dropped = old_state.size() - matched;

            instance_ = std::move(replacement);
            return report;
        }

        void save(torch::serialize::OutputArchive& archive) const { instance_->save(archive); }

        // Reads into a scratch optimizer first so a malformed archive leaves this binding untouched.
        void load(torch::serialize::InputArchive& archive)
        {
            auto scratch = std::make_unique<torch::optim::Adam>(instance_->param_groups().front().params(),
                                                                to_torch_options(options_));
            scratch->load(archive);
            const auto& params = scratch->param_groups().front().params();
            for (const auto& parameter : params) {
                const auto it = scratch->state().find(parameter.unsafeGetTensorImpl());
                if (it == scratch->state().end()) {
                    continue;
                }
                const auto& state = static_cast<const torch::optim::AdamParamState&>(*it->second);
                if (!state.exp_avg().defined() || state.exp_avg().sizes() != parameter.sizes()) {
                    throw std::runtime_error("Optimizer state does not match the shape of its parameter.");
                }
            }
            instance_ = std::move(scratch);
        }

    private:
        AdamOptions options_;
        std::unique_ptr<torch::optim::Adam> instance_;
    };

}

#endif // STRATA_OPTIMIZER_DETAILS_ADAM_HPP
