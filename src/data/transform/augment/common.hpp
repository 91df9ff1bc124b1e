#ifndef STRATA_DATA_TRANSFORM_AUGMENTATION_COMMON_HPP
#define STRATA_DATA_TRANSFORM_AUGMENTATION_COMMON_HPP

#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <torch/torch.h>

namespace Strata::Data::Transform::Augmentation {
    // Every augmentation draws from the generator of the worker that runs it.
    using Generator = std::mt19937_64;

    namespace Details {
        inline bool coin(Generator& rng, double probability = 0.5) {
            if (probability <= 0.0) {
                return false;
            }
            std::bernoulli_distribution draw(std::clamp(probability, 0.0, 1.0));
            return draw(rng);
        }

        inline int uniform_int(Generator& rng, int low, int high) {
            std::uniform_int_distribution<int> draw(low, high);
            return draw(rng);
        }

        inline void require_image(const cv::Mat& image, const char* name) {
            if (image.empty()) {
                throw std::invalid_argument(std::string(name) + " received an empty image.");
            }
        }
    }

    // 8-bit HxWxC (RGB order) -> float CHW tensor in [0, 1].
    inline torch::Tensor ToTensor(const cv::Mat& image) {
        Details::require_image(image, "ToTensor");
        cv::Mat image_float;
        image.convertTo(image_float, CV_32F, 1.0 / 255.0);
        if (!image_float.isContinuous()) {
            image_float = image_float.clone();
        }
        const auto options = torch::TensorOptions().dtype(torch::kFloat32);
        auto tensor = torch::from_blob(image_float.data,
                                       {image_float.rows, image_float.cols, image_float.channels()},
                                       options).clone();
        return tensor.permute({2, 0, 1}).contiguous();
    }
}

#endif // STRATA_DATA_TRANSFORM_AUGMENTATION_COMMON_HPP
