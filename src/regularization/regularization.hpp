#ifndef STRATA_REGULARIZATION_HPP
#define STRATA_REGULARIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/drift.hpp"
#include "details/wgangp.hpp"

namespace Strata::Regularization {

    using WGANGPOptions = Details::WGANGPOptions;
    using WGANGPDescriptor = Details::WGANGPDescriptor;

    using DriftOptions = Details::DriftOptions;
    using DriftDescriptor = Details::DriftDescriptor;

    [[nodiscard]] constexpr auto WGANGP(const WGANGPOptions& options = {}) noexcept -> WGANGPDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Drift(const DriftOptions& options = {}) noexcept -> DriftDescriptor {
        return {options};
    }

    using Details::gradient_penalty;
    using Details::interpolate;
    using Details::penalty;
}

#endif // STRATA_REGULARIZATION_HPP
