#ifndef STRATA_DATA_TRANSFORM_FORMAT_HPP
#define STRATA_DATA_TRANSFORM_FORMAT_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>
#include <torch/nn/functional.h>

namespace Strata::Data::Transform::Format {
    namespace Details {

        inline torch::Tensor to_float32(const torch::Tensor& tensor) {
            if (tensor.scalar_type() == torch::kFloat32) {
                return tensor;
            }
            return tensor.to(tensor.options().dtype(torch::kFloat32));
        }

        // Nearest-neighbour resize of an (N,C,H,W) batch to `height` x `width`.
        inline torch::Tensor upsample_nearest(const torch::Tensor& batch, std::int64_t height, std::int64_t width) {
            if (batch.dim() != 4) {
                throw std::invalid_argument("Format::upsample_nearest expects an (N,C,H,W) batch.");
            }
            auto opts = torch::nn::functional::InterpolateFuncOptions()
                            .size(std::vector<std::int64_t>{height, width})
                            .mode(torch::kNearest);
            return torch::nn::functional::interpolate(batch, opts);
        }
    }

    // Adaptive average pooling down to `resolution` x `resolution`.
    inline torch::Tensor PoolTo(const torch::Tensor& batch, std::int64_t resolution) {
        if (!batch.defined() || batch.dim() != 4) {
            throw std::invalid_argument("Format::PoolTo expects an (N,C,H,W) batch.");
        }
        if (batch.size(-1) == resolution && batch.size(-2) == resolution) {
            return Details::to_float32(batch);
        }
        return torch::nn::functional::adaptive_avg_pool2d(
            Details::to_float32(batch),
            torch::nn::functional::AdaptiveAvgPool2dFuncOptions(resolution));
    }

    // Real-data counterpart of the network fade-in: the half-resolution view of the batch, nearest
    // upsampled back, mixed with the batch itself as (1 - alpha) * previous + alpha * current.
    inline torch::Tensor FadeResolution(const torch::Tensor& current, double alpha) {
        if (!current.defined() || current.dim() != 4) {
            throw std::invalid_argument("Format::FadeResolution expects an (N,C,H,W) batch.");
        }
        if (current.size(-1) % 2 != 0 || current.size(-2) % 2 != 0) {
            throw std::invalid_argument("Format::FadeResolution needs even spatial dimensions.");
        }
        auto pooled = torch::nn::functional::avg_pool2d(current, torch::nn::functional::AvgPool2dFuncOptions(2));
        auto previous = Details::upsample_nearest(pooled, current.size(-2), current.size(-1));
        return previous.mul(1.0 - alpha) + current.mul(alpha);
    }

    // [0, 1] -> [-1, 1]
    inline torch::Tensor ToSignedRange(const torch::Tensor& tensor) {
        return tensor.mul(2.0).sub(1.0);
    }

    // Full real-batch preparation for one tick of a stage.
    inline torch::Tensor PrepareReal(const torch::Tensor& batch, std::int64_t resolution, std::int64_t stage, double alpha) {
        auto current = PoolTo(batch, resolution);
        if (stage > 1) {
            current = FadeResolution(current, alpha);
        }
        return ToSignedRange(current);
    }
}

#endif // STRATA_DATA_TRANSFORM_FORMAT_HPP
