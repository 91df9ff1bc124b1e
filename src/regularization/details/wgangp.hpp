#ifndef STRATA_REGULARIZATION_DETAILS_WGANGP_HPP
#define STRATA_REGULARIZATION_DETAILS_WGANGP_HPP

#include <optional>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

namespace Strata::Regularization::Details {

    struct WGANGPOptions {
        double coefficient{10.0};
        double target{1.0};
    };

    struct WGANGPDescriptor {
        WGANGPOptions options{};
    };

    [[nodiscard]] inline torch::Tensor penalty(const WGANGPDescriptor& descriptor, const torch::Tensor& gradients)
    {
        const auto& options = descriptor.options;
        if (options.coefficient == 0.0 || gradients.numel() == 0 || gradients.dim() == 0) {
            return gradients.new_zeros({});
        }

        auto tensor = gradients.reshape({gradients.size(0), -1});
        auto norms = tensor.norm(2, 1, false);
        auto penalty_value = (norms - options.target).pow(2).mean();
        return penalty_value.mul(options.coefficient);
    }

    // eps * real + (1 - eps) * fake with one eps per sample, detached from both producers.
    [[nodiscard]] inline torch::Tensor interpolate(const torch::Tensor& real,
                                                   const torch::Tensor& fake,
                                                   const torch::Tensor& epsilon)
    {
        if (real.sizes() != fake.sizes()) {
            throw std::invalid_argument("Gradient penalty needs real and fake batches of identical shape.");
        }
        auto eps = epsilon.to(real.device(), real.scalar_type()).reshape({real.size(0), 1, 1, 1});
        return (eps * real.detach() + (1.0 - eps) * fake.detach()).requires_grad_(true);
    }

    // Full WGAN-GP term: interpolate, run the critic, differentiate with create_graph so the
    // penalty itself is differentiable w.r.t. the critic parameters.
    template <typename Critic>
    [[nodiscard]] torch::Tensor gradient_penalty(Critic& critic,
                                                 const torch::Tensor& real,
                                                 const torch::Tensor& fake,
                                                 const WGANGPDescriptor& descriptor = {},
                                                 std::optional<torch::Tensor> epsilon = std::nullopt)
    {
        if (!epsilon) {
            epsilon = torch::rand({real.size(0)}, real.options());
        }
        auto interpolates = interpolate(real, fake, *epsilon);
        auto scores = critic(interpolates);
        auto gradients = torch::autograd::grad({scores},
                                               {interpolates},
                                               {torch::ones_like(scores)},
                                               /*retain_graph=*/true,
                                               /*create_graph=*/true)[0];
        return penalty(descriptor, gradients);
    }

}

#endif // STRATA_REGULARIZATION_DETAILS_WGANGP_HPP
