#ifndef STRATA_REGULARIZATION_DETAILS_DRIFT_HPP
#define STRATA_REGULARIZATION_DETAILS_DRIFT_HPP

#include <torch/torch.h>

namespace Strata::Regularization::Details {

    // Keeps critic scores on real data from drifting away from zero.
    struct DriftOptions {
        double coefficient{0.001};
    };

    struct DriftDescriptor {
        DriftOptions options{};
    };

    [[nodiscard]] inline torch::Tensor penalty(const DriftDescriptor& descriptor, const torch::Tensor& real_scores)
    {
        if (descriptor.options.coefficient == 0.0 || real_scores.numel() == 0) {
            return real_scores.new_zeros({});
        }
        return real_scores.pow(2).mean().mul(descriptor.options.coefficient);
    }

}

#endif // STRATA_REGULARIZATION_DETAILS_DRIFT_HPP
