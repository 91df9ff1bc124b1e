#ifndef STRATA_LOSS_DETAILS_WASSERSTEIN_HPP
#define STRATA_LOSS_DETAILS_WASSERSTEIN_HPP

#include <torch/torch.h>

namespace Strata::Loss::Details {

    struct CriticTerms {
        torch::Tensor real;         // mean critic score on real data
        torch::Tensor fake;         // mean critic score on generated data
        torch::Tensor wasserstein;  // fake - real, the critic's estimate of -W(P_r, P_g)
    };

    struct WassersteinOptions {};

    struct WassersteinDescriptor {
        WassersteinOptions options{};
    };

    [[nodiscard]] inline CriticTerms critic(const WassersteinDescriptor&,
                                            const torch::Tensor& real_scores,
                                            const torch::Tensor& fake_scores)
    {
        CriticTerms terms{real_scores.mean(), fake_scores.mean(), {}};
        terms.wasserstein = terms.fake - terms.real;
        return terms;
    }

    [[nodiscard]] inline torch::Tensor generator(const WassersteinDescriptor&, const torch::Tensor& fake_scores)
    {
        return fake_scores.mean().mul(-1.0);
    }

}

#endif // STRATA_LOSS_DETAILS_WASSERSTEIN_HPP
