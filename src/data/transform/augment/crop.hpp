#ifndef STRATA_DATA_TRANSFORM_AUGMENTATION_CROP_HPP
#define STRATA_DATA_TRANSFORM_AUGMENTATION_CROP_HPP

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "common.hpp"

namespace Strata::Data::Transform::Augmentation {
    namespace Options {
        struct RatioCenterCropOptions {
            double ratio{1.0};  // width / height of the kept window
        };
    }

    // Largest centred window with the requested aspect ratio.
    inline cv::Mat RatioCenterCrop(const cv::Mat& image, Options::RatioCenterCropOptions options = {}) {
        Details::require_image(image, "RatioCenterCrop");
        if (options.ratio <= 0.0) {
            throw std::invalid_argument("RatioCenterCrop ratio must be positive.");
        }
        int width = image.cols;
        int height = static_cast<int>(std::lround(width / options.ratio));
        if (height > image.rows) {
            height = image.rows;
            width = static_cast<int>(std::lround(height * options.ratio));
        }
        const int x = (image.cols - width) / 2;
        const int y = (image.rows - height) / 2;
        return image(cv::Rect(x, y, width, height)).clone();
    }

    // Square resize with area interpolation (anti-aliased when shrinking).
    inline cv::Mat ResizeSquare(const cv::Mat& image, int size) {
        Details::require_image(image, "ResizeSquare");
        if (size <= 0) {
            throw std::invalid_argument("ResizeSquare size must be positive.");
        }
        cv::Mat resized;
        const int interpolation = (size < image.cols || size < image.rows) ? cv::INTER_AREA : cv::INTER_LINEAR;
        cv::resize(image, resized, cv::Size(size, size), 0.0, 0.0, interpolation);
        return resized;
    }

    inline cv::Mat RandomCrop(const cv::Mat& image, int size, Generator& rng) {
        Details::require_image(image, "RandomCrop");
        if (size > image.cols || size > image.rows) {
            throw std::invalid_argument("RandomCrop of " + std::to_string(size) + " does not fit a "
                                        + std::to_string(image.cols) + "x" + std::to_string(image.rows) + " image.");
        }
        const int x = Details::uniform_int(rng, 0, image.cols - size);
        const int y = Details::uniform_int(rng, 0, image.rows - size);
        return image(cv::Rect(x, y, size, size)).clone();
    }
}

#endif // STRATA_DATA_TRANSFORM_AUGMENTATION_CROP_HPP
