#ifndef STRATA_NETWORK_DETAILS_LAYERS_HPP
#define STRATA_NETWORK_DETAILS_LAYERS_HPP

#include <cstdint>
#include <vector>

#include <torch/torch.h>

#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"

namespace Strata::Network::Details {
    namespace F = torch::nn::functional;

    inline constexpr double kLeakySlope = 0.2;

    [[nodiscard]] inline torch::Tensor leaky(const torch::Tensor& input)
    {
        return F::leaky_relu(input, F::LeakyReLUFuncOptions().negative_slope(kLeakySlope));
    }

    // Per-pixel feature vector normalisation across channels.
    [[nodiscard]] inline torch::Tensor pixel_norm(const torch::Tensor& input, double eps = 1e-8)
    {
        return input * torch::rsqrt(input.pow(2).mean(1, /*keepdim=*/true) + eps);
    }

    [[nodiscard]] inline torch::Tensor upsample2x(const torch::Tensor& input)
    {
        return F::interpolate(input, F::InterpolateFuncOptions()
                                         .scale_factor(std::vector<double>{2.0, 2.0})
                                         .mode(torch::kNearest));
    }

    [[nodiscard]] inline torch::Tensor downsample2x(const torch::Tensor& input)
    {
        return F::avg_pool2d(input, F::AvgPool2dFuncOptions(2));
    }

    // Appends the batch-wide mean standard deviation as one constant feature map.
    [[nodiscard]] inline torch::Tensor minibatch_stddev(const torch::Tensor& input)
    {
        auto stddev = torch::sqrt(input.var(0, /*unbiased=*/false) + 1e-8).mean();
        auto feature = stddev.expand({input.size(0), 1, input.size(2), input.size(3)});
        return torch::cat({input, feature}, 1);
    }

    [[nodiscard]] inline torch::nn::Conv2d make_conv(std::int64_t in, std::int64_t out, std::int64_t kernel, std::int64_t padding)
    {
        torch::nn::Conv2d conv(torch::nn::Conv2dOptions(in, out, kernel).padding(padding));
        Initialization::Details::apply_module_initialization(conv, Initialization::KaimingLeaky);
        return conv;
    }

    // latent -> init_size x init_size feature map
    class GeneratorStemImpl : public torch::nn::Module {
    public:
        GeneratorStemImpl(std::int64_t latent_dim, std::int64_t channels, std::int64_t init_size)
            : channels_(channels), init_size_(init_size)
        {
            dense_ = register_module("dense", torch::nn::Linear(latent_dim, channels * init_size * init_size));
            Initialization::Details::apply_module_initialization(dense_, Initialization::KaimingLeaky);
            conv_ = register_module("conv", make_conv(channels, channels, 3, 1));
        }

        torch::Tensor forward(torch::Tensor z)
        {
            auto x = dense_->forward(pixel_norm(z)).view({z.size(0), channels_, init_size_, init_size_});
            x = pixel_norm(leaky(x));
            return pixel_norm(leaky(conv_->forward(x)));
        }

    private:
        std::int64_t channels_;
        std::int64_t init_size_;
        torch::nn::Linear dense_{nullptr};
        torch::nn::Conv2d conv_{nullptr};
    };
    TORCH_MODULE(GeneratorStem);

    // Doubles the resolution: nearest upsample, then two 3x3 convolutions.
    class UpBlockImpl : public torch::nn::Module {
    public:
        UpBlockImpl(std::int64_t in_channels, std::int64_t out_channels)
        {
            conv1_ = register_module("conv1", make_conv(in_channels, out_channels, 3, 1));
            conv2_ = register_module("conv2", make_conv(out_channels, out_channels, 3, 1));
        }

        torch::Tensor forward(torch::Tensor x)
        {
            x = upsample2x(x);
            x = pixel_norm(leaky(conv1_->forward(x)));
            return pixel_norm(leaky(conv2_->forward(x)));
        }

    private:
        torch::nn::Conv2d conv1_{nullptr};
        torch::nn::Conv2d conv2_{nullptr};
    };
    TORCH_MODULE(UpBlock);

    // Halves the resolution: two 3x3 convolutions, then 2x2 average pooling.
    class DownBlockImpl : public torch::nn::Module {
    public:
        DownBlockImpl(std::int64_t in_channels, std::int64_t out_channels)
        {
            conv1_ = register_module("conv1", make_conv(in_channels, in_channels, 3, 1));
            conv2_ = register_module("conv2", make_conv(in_channels, out_channels, 3, 1));
        }

        torch::Tensor forward(torch::Tensor x)
        {
            x = leaky(conv1_->forward(x));
            x = leaky(conv2_->forward(x));
            return downsample2x(x);
        }

    private:
        torch::nn::Conv2d conv1_{nullptr};
        torch::nn::Conv2d conv2_{nullptr};
    };
    TORCH_MODULE(DownBlock);

    // init_size x init_size features -> one critic score per sample.
    class CriticHeadImpl : public torch::nn::Module {
    public:
        CriticHeadImpl(std::int64_t channels, std::int64_t init_size)
        {
            conv1_ = register_module("conv1", make_conv(channels + 1, channels, 3, 1));
            conv2_ = register_module("conv2", make_conv(channels, channels, init_size, 0));
            dense_ = register_module("dense", torch::nn::Linear(channels, 1));
            Initialization::Details::apply_module_initialization(dense_, Initialization::XavierNormal);
        }

        torch::Tensor forward(torch::Tensor x)
        {
            x = minibatch_stddev(x);
            x = leaky(conv1_->forward(x));
            x = leaky(conv2_->forward(x));
            return dense_->forward(x.flatten(1));
        }

    private:
        torch::nn::Conv2d conv1_{nullptr};
        torch::nn::Conv2d conv2_{nullptr};
        torch::nn::Linear dense_{nullptr};
    };
    TORCH_MODULE(CriticHead);
}

#endif // STRATA_NETWORK_DETAILS_LAYERS_HPP
