#ifndef STRATA_TRAINING_ADVERSARIAL_HPP
#define STRATA_TRAINING_ADVERSARIAL_HPP
/*
 * One WGAN-GP update: a critic step followed by a generator step.
 *
 *   D_loss = mean(D(G(z))) - mean(D(x)) + drift * mean(D(x)^2) + gp
 *   G_loss = -mean(D(G(z')))             z' drawn afresh
 *
 * The returned scalars are read before the corresponding backward pass.
 */

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

#include "../loss/loss.hpp"
#include "../regularization/regularization.hpp"
#include "context.hpp"

namespace Strata::Training {

    struct StepLosses {
        double generator{0.0};
        double discriminator{0.0};
        double wasserstein{0.0};
    };

    struct AdversarialOptions {
        std::int64_t latent_dim{512};
        Loss::WassersteinDescriptor loss{};
        Regularization::WGANGPDescriptor gradient_penalty{};
        Regularization::DriftDescriptor drift{};
    };

    [[nodiscard]] inline torch::Tensor sample_latent(std::int64_t batch, std::int64_t latent_dim, const torch::Device& device)
    {
        return torch::randn({batch, latent_dim}, torch::TensorOptions().dtype(torch::kFloat32).device(device));
    }

    // `real` must already sit on the training device, be blended to the current stage and span [-1, 1].
    inline StepLosses adversarial_step(Context& context, const torch::Tensor& real, const AdversarialOptions& options)
    {
        if (!real.defined() || real.dim() != 4) {
            throw std::invalid_argument("Adversarial step expects a defined [N, C, H, W] batch.");
        }
        auto& generator = context.generator;
        auto& discriminator = context.discriminator;
        const auto batch = real.size(0);

        generator->train();
        discriminator->train();

        StepLosses losses{};

        // Critic
        discriminator->zero_grad();
        context.discriminator_optimizer.zero_grad();

        auto real_scores = discriminator->forward(real);
        auto fake = generator->forward(sample_latent(batch, options.latent_dim, context.device));
        auto fake_scores = discriminator->forward(fake.detach());

        auto terms = Loss::critic(options.loss, real_scores, fake_scores);
        auto drift = Regularization::penalty(options.drift, real_scores);
        auto gp = Regularization::gradient_penalty(discriminator, real, fake, options.gradient_penalty);
        auto discriminator_loss = terms.wasserstein + drift + gp;

        losses.wasserstein = terms.wasserstein.item<double>();
        losses.discriminator = discriminator_loss.item<double>();
        discriminator_loss.backward();
        context.discriminator_optimizer.step();

        // Generator
        generator->zero_grad();
        context.generator_optimizer.zero_grad();

        auto generated = generator->forward(sample_latent(batch, options.latent_dim, context.device));
        auto generator_loss = Loss::generator(options.loss, discriminator->forward(generated));

        losses.generator = generator_loss.item<double>();
        generator_loss.backward();
        context.generator_optimizer.step();

        return losses;
    }
}

#endif // STRATA_TRAINING_ADVERSARIAL_HPP
