#ifndef STRATA_DATA_TRANSFORM_AUGMENTATION_FLIP_HPP
#define STRATA_DATA_TRANSFORM_AUGMENTATION_FLIP_HPP

#include <opencv2/core.hpp>

#include "common.hpp"

namespace Strata::Data::Transform::Augmentation {
    namespace Options {
        enum class FlipAxis { Vertical, Horizontal };

        struct FlipOptions {
            FlipAxis axis{FlipAxis::Horizontal};
            double frequency{0.5};
        };
    }

    inline cv::Mat RandomFlip(const cv::Mat& image, Options::FlipOptions options, Generator& rng) {
        Details::require_image(image, "RandomFlip");
        if (!Details::coin(rng, options.frequency)) {
            return image;
        }
        cv::Mat flipped;
        // OpenCV: 0 flips around the x axis (upside down), 1 around the y axis (mirror).
        cv::flip(image, flipped, options.axis == Options::FlipAxis::Vertical ? 0 : 1);
        return flipped;
    }
}

#endif // STRATA_DATA_TRANSFORM_AUGMENTATION_FLIP_HPP
