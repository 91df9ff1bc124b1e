#ifndef STRATA_DATA_LOAD_HPP
#define STRATA_DATA_LOAD_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../transform/augment/augment.hpp"
#include "types.hpp"

namespace Strata::Data::Load {
    namespace Details {
        inline std::string trim_copy(const std::string& value)
        {
            const auto not_space = [](unsigned char character) { return !std::isspace(character); };
            auto first = std::find_if(value.begin(), value.end(), not_space);
            auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
            if (first >= last) {
                return {};
            }
            std::string result(first, last);
            while (!result.empty() && (result.front() == '"' || result.front() == '\'')) {
                result.erase(result.begin());
            }
            while (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
                result.pop_back();
            }
            return result;
        }

        inline std::vector<std::string> split_csv_line(const std::string& line, char delimiter = ',')
        {
            std::vector<std::string> tokens;
            std::string cur;
            bool in_quote = false;

            for (std::size_t i = 0; i < line.size(); ++i) {
                const char c = line[i];
                if (c == '"') {
                    // escaped double quote ("")
                    if (in_quote && i + 1 < line.size() && line[i + 1] == '"') {
                        cur.push_back('"');
                        ++i;
                    } else {
                        in_quote = !in_quote;
                    }
                    continue;
                }
                if (!in_quote && c == delimiter) {
                    tokens.emplace_back(trim_copy(cur));
                    cur.clear();
                    continue;
                }
                cur.push_back(c);
            }
            tokens.emplace_back(trim_copy(cur));
            return tokens;
        }

        inline std::string strip_utf8_bom(std::string value)
        {
            constexpr unsigned char bom[] = {0xEF, 0xBB, 0xBF};
            if (value.size() >= 3 &&
                static_cast<unsigned char>(value[0]) == bom[0] &&
                static_cast<unsigned char>(value[1]) == bom[1] &&
                static_cast<unsigned char>(value[2]) == bom[2]) {
                value.erase(0, 3);
            }
            return value;
        }

        inline constexpr std::array<const char*, 5> kImageExtensions = {".png", ".jpg", ".jpeg", ".bmp", ".ppm"};

        inline bool has_image_extension(const std::filesystem::path& path)
        {
            auto ext = path.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return std::any_of(kImageExtensions.begin(), kImageExtensions.end(), [&](const char* candidate) {
                return ext == candidate;
            });
        }

        inline std::vector<std::filesystem::path> collect_image_files(const std::filesystem::path& directory, bool recursive)
        {
            namespace fs = std::filesystem;
            if (!fs::exists(directory) || !fs::is_directory(directory)) {
                throw std::runtime_error("Image folder not found: " + directory.string());
            }

            std::vector<fs::path> files;
            const auto add_if_supported = [&](const fs::path& candidate) {
                if (fs::is_regular_file(candidate) && has_image_extension(candidate)) {
                    files.push_back(candidate);
                }
            };
            if (recursive) {
                for (const auto& entry : fs::recursive_directory_iterator(directory, fs::directory_options::skip_permission_denied)) {
                    add_if_supported(entry.path());
                }
            } else {
                for (const auto& entry : fs::directory_iterator(directory)) {
                    add_if_supported(entry.path());
                }
            }
            std::sort(files.begin(), files.end());
            return files;
        }
    }

    [[nodiscard]] inline std::vector<std::filesystem::path> list_images(const Type::ImageFolder& descriptor)
    {
        auto files = Details::collect_image_files(descriptor.directory, descriptor.parameters.recursive);
        if (files.empty()) {
            throw std::runtime_error("Image folder '" + descriptor.directory + "' contains no supported files.");
        }
        return files;
    }

    [[nodiscard]] inline std::vector<std::filesystem::path> list_images(const Type::Manifest& descriptor)
    {
        namespace fs = std::filesystem;
        const fs::path manifest(descriptor.file);
        std::ifstream stream(manifest);
        if (!stream) {
            throw std::runtime_error("Failed to open manifest: " + manifest.string());
        }
        const auto& parameters = descriptor.parameters;
        const fs::path root = parameters.root.empty() ? manifest.parent_path() : fs::path(parameters.root);

        std::vector<fs::path> files;
        std::string line;
        std::size_t line_number = 0;
        while (std::getline(stream, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line_number == 1) {
                line = Details::strip_utf8_bom(std::move(line));
            }
            if (Details::trim_copy(line).empty()) {
                continue;
            }
            const auto tokens = Details::split_csv_line(line, parameters.delimiter);
            if (parameters.column >= tokens.size()) {
                throw std::runtime_error("Manifest " + manifest.string() + " line " + std::to_string(line_number)
                                         + " has no column " + std::to_string(parameters.column) + ".");
            }
            const fs::path entry(tokens[parameters.column]);
            if (!Details::has_image_extension(entry)) {
                if (line_number == 1) {
                    continue;
                }
                throw std::runtime_error("Manifest " + manifest.string() + " line " + std::to_string(line_number)
                                         + " does not name a supported image: " + entry.string());
            }
            files.push_back(entry.is_absolute() ? entry : root / entry);
        }
        if (files.empty()) {
            throw std::runtime_error("Manifest lists no images: " + manifest.string());
        }
        return files;
    }

    // Decodes to 8-bit RGB. OpenCV hands back BGR.
    [[nodiscard]] inline cv::Mat read_image(const std::filesystem::path& path, std::int64_t channels = 3)
    {
        const auto flag = channels == 1 ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR;
        cv::Mat image = cv::imread(path.string(), flag);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode image: " + path.string());
        }
        if (channels == 3) {
            cv::cvtColor(image, image, cv::COLOR_BGR2RGB);
        }
        return image;
    }

    // Images on disk, decoded and augmented lazily, one sample at a time.
    class ImageDataset {
    public:
        ImageDataset(std::vector<std::filesystem::path> files,
                     Transform::Augmentation::Options::PipelineOptions pipeline,
                     std::int64_t channels = 3)
            : files_(std::move(files)), pipeline_(pipeline), channels_(channels)
        {
            if (files_.empty()) {
                throw std::invalid_argument("ImageDataset requires at least one image.");
            }
            if (channels_ != 1 && channels_ != 3) {
                throw std::invalid_argument("ImageDataset supports 1 or 3 channels, got " + std::to_string(channels_) + ".");
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }
        [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }
        [[nodiscard]] std::int64_t sample_size() const noexcept { return pipeline_.size; }
        [[nodiscard]] std::int64_t channels() const noexcept { return channels_; }

        // CHW float in [0, 1], `size` x `size`.
        [[nodiscard]] torch::Tensor get(std::size_t index, Transform::Augmentation::Generator& rng) const
        {
            const auto image = read_image(files_.at(index), channels_);
            return Transform::Augmentation::Apply(image, pipeline_, rng);
        }

    private:
        std::vector<std::filesystem::path> files_;
        Transform::Augmentation::Options::PipelineOptions pipeline_;
        std::int64_t channels_;
    };
}

#endif // STRATA_DATA_LOAD_HPP
