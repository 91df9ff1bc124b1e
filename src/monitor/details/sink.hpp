#ifndef STRATA_MONITOR_DETAILS_SINK_HPP
#define STRATA_MONITOR_DETAILS_SINK_HPP

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace Strata::Monitor::Details {

    using Series = std::vector<std::pair<std::int64_t, double>>;
    using History = std::map<std::string, Series>;

    class Sink {
    public:
        virtual ~Sink() = default;
        virtual void add_scalar(const std::string& tag, double value, std::int64_t step) = 0;
        // `grid` is [C, H, W] in [0, 1].
        virtual void add_image(const std::string& tag, const torch::Tensor& grid, std::int64_t step) = 0;
        [[nodiscard]] virtual const History& history() const = 0;
    };

    // "train/G_loss" -> "train_G_loss"
    [[nodiscard]] inline std::string file_stem(const std::string& tag)
    {
        std::string stem = tag;
        std::replace_if(stem.begin(), stem.end(), [](char c) { return c == '/' || c == '\\' || c == ' ' || c == ':'; }, '_');
        return stem;
    }

    // [C, H, W] float in [0, 1] -> 8-bit BGR(A)/gray matrix ready for cv::imwrite.
    [[nodiscard]] inline cv::Mat to_image(const torch::Tensor& grid)
    {
        if (!grid.defined() || grid.dim() != 3) {
            throw std::invalid_argument("Image grids must be [C, H, W] tensors.");
        }
        const auto channels = grid.size(0);
        if (channels != 1 && channels != 3) {
            throw std::invalid_argument("Image grids must have 1 or 3 channels.");
        }
        auto bytes = grid.detach().to(torch::kCPU, torch::kFloat32).clamp(0.0, 1.0).mul(255.0).round()
                         .to(torch::kUInt8).permute({1, 2, 0}).contiguous();
        const int type = channels == 1 ? CV_8UC1 : CV_8UC3;
        cv::Mat image(static_cast<int>(bytes.size(0)), static_cast<int>(bytes.size(1)), type, bytes.data_ptr<std::uint8_t>());
        cv::Mat owned = image.clone();
        if (channels == 3) {
            cv::cvtColor(owned, owned, cv::COLOR_RGB2BGR);
        }
        return owned;
    }

    // Scalars go to <root>/scalars/<tag>.csv as "step,value" rows, image grids to
    // <root>/images/<tag>_<step>.png. One append stream stays open per tag. The in-memory
    // history is only kept when `keep_history` is set (curve rendering reads it).
    class DirectorySink final : public Sink {
    public:
        explicit DirectorySink(std::filesystem::path root, bool keep_history = false)
            : root_(std::move(root)), keep_history_(keep_history)
        {
            std::filesystem::create_directories(root_ / "scalars");
            std::filesystem::create_directories(root_ / "images");
        }

        void add_scalar(const std::string& tag, double value, std::int64_t step) override
        {
            auto& stream = scalar_stream(tag);
            stream << step << ',' << std::setprecision(10) << value << '\n';
            stream.flush();
            if (!stream) {
                throw std::runtime_error("Failed to append to the scalar log of '" + tag + "'.");
            }
            if (keep_history_) {
                history_[tag].emplace_back(step, value);
            }
        }

        void add_image(const std::string& tag, const torch::Tensor& grid, std::int64_t step) override
        {
            const auto path = root_ / "images" / (file_stem(tag) + "_" + std::to_string(step) + ".png");
            if (!cv::imwrite(path.string(), to_image(grid))) {
                throw std::runtime_error("Failed to write image: " + path.string());
            }
        }

        [[nodiscard]] const History& history() const override { return history_; }
        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
        [[nodiscard]] bool keeps_history() const noexcept { return keep_history_; }

    private:
        std::ofstream& scalar_stream(const std::string& tag)
        {
            auto it = streams_.find(tag);
            if (it != streams_.end()) {
                return it->second;
            }
            const auto path = root_ / "scalars" / (file_stem(tag) + ".csv");
            const bool fresh = !std::filesystem::exists(path);
            std::ofstream stream(path, std::ios::app);
            if (!stream) {
                throw std::runtime_error("Failed to open scalar log: " + path.string());
            }
            if (fresh) {
                stream << "step,value\n";
            }
            return streams_.emplace(tag, std::move(stream)).first->second;
        }

        std::filesystem::path root_;
        bool keep_history_;
        std::map<std::string, std::ofstream> streams_{};
        History history_{};
    };
}

#endif // STRATA_MONITOR_DETAILS_SINK_HPP
