#ifndef STRATA_OPTIMIZER_HPP
#define STRATA_OPTIMIZER_HPP

#include "details/adam.hpp"

namespace Strata::Optimizer {
    using AdamOptions = Details::AdamOptions;
    using Binding = Details::AdamBinding;
    using RebindReport = Details::RebindReport;
}

#endif //STRATA_OPTIMIZER_HPP
