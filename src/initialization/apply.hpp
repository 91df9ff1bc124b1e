#ifndef STRATA_INITIALIZATION_APPLY_HPP
#define STRATA_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Strata::Initialization::Details {
    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(const Module& module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }
    }  // namespace detail

    template <class Module>
    inline void apply_module_initialization(const Module& module, const Descriptor& descriptor) {
        torch::NoGradGuard no_grad;
        switch (descriptor.type) {
            case Type::KaimingNormal:
                torch::nn::init::kaiming_normal_(module->weight,
                                                 descriptor.negative_slope,
                                                 torch::kFanIn,
                                                 torch::kLeakyReLU);
                detail::zero_bias_if_present(module);
                break;
            case Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight);
                detail::zero_bias_if_present(module);
                break;
        }
    }
}
#endif // STRATA_INITIALIZATION_APPLY_HPP
