#ifndef STRATA_LOSS_HPP
#define STRATA_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/wasserstein.hpp"

namespace Strata::Loss {

    using CriticTerms = Details::CriticTerms;
    using WassersteinOptions = Details::WassersteinOptions;
    using WassersteinDescriptor = Details::WassersteinDescriptor;

    [[nodiscard]] constexpr auto Wasserstein(const WassersteinOptions& options = {}) noexcept -> WassersteinDescriptor {
        return {options};
    }

    using Details::critic;
    using Details::generator;
}

#endif // STRATA_LOSS_HPP
