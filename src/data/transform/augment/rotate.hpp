#ifndef STRATA_DATA_TRANSFORM_AUGMENTATION_ROTATE_HPP
#define STRATA_DATA_TRANSFORM_AUGMENTATION_ROTATE_HPP

#include <opencv2/core.hpp>

#include "common.hpp"

namespace Strata::Data::Transform::Augmentation {

    // Rotation by 0, 90, 180 or 270 degrees, each equally likely.
    inline cv::Mat RandomRotate90(const cv::Mat& image, Generator& rng) {
        Details::require_image(image, "RandomRotate90");
        cv::Mat rotated;
        switch (Details::uniform_int(rng, 0, 3)) {
            case 1:
                cv::rotate(image, rotated, cv::ROTATE_90_CLOCKWISE);
                return rotated;
            case 2:
                cv::rotate(image, rotated, cv::ROTATE_180);
                return rotated;
            case 3:
                cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
                return rotated;
            default:
                return image;
        }
    }
}

#endif // STRATA_DATA_TRANSFORM_AUGMENTATION_ROTATE_HPP
