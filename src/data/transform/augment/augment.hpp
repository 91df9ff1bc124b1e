#ifndef STRATA_DATA_TRANSFORM_AUGMENTATION_HPP
#define STRATA_DATA_TRANSFORM_AUGMENTATION_HPP

#include <torch/torch.h>
#include <opencv2/core.hpp>

#include "common.hpp"
#include "crop.hpp"
#include "flip.hpp"
#include "rotate.hpp"

namespace Strata::Data::Transform::Augmentation {
    namespace Options {
        struct PipelineOptions {
            double ratio{1.0};
            int load_size{300};
            int size{256};
            bool rotate{true};
            bool vertical_flip{true};
            bool horizontal_flip{true};
        };
    }

    // Centre crop -> resize -> random crop -> rotation -> flips -> CHW [0, 1].
    inline torch::Tensor Apply(const cv::Mat& image, const Options::PipelineOptions& options, Generator& rng) {
        auto working = RatioCenterCrop(image, {.ratio = options.ratio});
        working = ResizeSquare(working, options.load_size);
        working = RandomCrop(working, options.size, rng);
        if (options.rotate) {
            working = RandomRotate90(working, rng);
        }
        if (options.vertical_flip) {
            working = RandomFlip(working, {.axis = Options::FlipAxis::Vertical}, rng);
        }
        if (options.horizontal_flip) {
            working = RandomFlip(working, {.axis = Options::FlipAxis::Horizontal}, rng);
        }
        return ToTensor(working);
    }
}

#endif // STRATA_DATA_TRANSFORM_AUGMENTATION_HPP
