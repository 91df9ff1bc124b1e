#ifndef STRATA_NETWORK_HPP
#define STRATA_NETWORK_HPP

#include "progressive.hpp"
#include "details/generator.hpp"
#include "details/discriminator.hpp"

namespace Strata::Network {
    using GeneratorOptions = Details::GeneratorOptions;
    using Generator = Details::Generator;
    using GeneratorImpl = Details::GeneratorImpl;

    using DiscriminatorOptions = Details::DiscriminatorOptions;
    using Discriminator = Details::Discriminator;
    using DiscriminatorImpl = Details::DiscriminatorImpl;
}

#endif // STRATA_NETWORK_HPP
