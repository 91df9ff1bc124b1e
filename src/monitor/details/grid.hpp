#ifndef STRATA_MONITOR_DETAILS_GRID_HPP
#define STRATA_MONITOR_DETAILS_GRID_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

namespace Strata::Monitor::Details {

    struct GridOptions {
        std::int64_t nrow{4};      // images per row
        std::int64_t padding{2};
        bool normalize{true};      // min/max rescale of each image on its own
        double pad_value{0.0};
    };

    // [N, C, H, W] -> [C', H', W'] in [0, 1]; single-channel batches are expanded to RGB.
    [[nodiscard]] inline torch::Tensor make_grid(const torch::Tensor& batch, GridOptions options = {})
    {
        if (!batch.defined() || batch.dim() != 4 || batch.size(0) == 0) {
            throw std::invalid_argument("make_grid expects a non-empty [N, C, H, W] batch.");
        }
        if (options.nrow <= 0 || options.padding < 0) {
            throw std::invalid_argument("make_grid needs a positive row width and a non-negative padding.");
        }

        auto images = batch.detach().to(torch::kCPU, torch::kFloat32);
        if (images.size(1) == 1) {
            images = images.expand({images.size(0), 3, images.size(2), images.size(3)});
        }
        if (options.normalize) {
            const auto flat = images.reshape({images.size(0), -1});
            const auto low = std::get<0>(flat.min(1, true)).reshape({-1, 1, 1, 1});
            const auto high = std::get<0>(flat.max(1, true)).reshape({-1, 1, 1, 1});
            images = (images - low) / (high - low).clamp_min(1e-5);
        }
        images = images.clamp(0.0, 1.0);

        const auto count = images.size(0);
        const auto columns = std::min(options.nrow, count);
        const auto rows = (count + columns - 1) / columns;
        const auto cell_h = images.size(2) + options.padding;
        const auto cell_w = images.size(3) + options.padding;

        auto grid = torch::full({images.size(1), rows * cell_h + options.padding, columns * cell_w + options.padding},
                                options.pad_value, images.options());
        for (std::int64_t k = 0; k < count; ++k) {
            const auto y = k / columns;
            const auto x = k % columns;
            grid.narrow(1, y * cell_h + options.padding, images.size(2))
                .narrow(2, x * cell_w + options.padding, images.size(3))
                .copy_(images[k]);
        }
        return grid;
    }
}

#endif // STRATA_MONITOR_DETAILS_GRID_HPP
