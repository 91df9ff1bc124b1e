#ifndef STRATA_MONITOR_HPP
#define STRATA_MONITOR_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/curves.hpp"
#include "details/grid.hpp"
#include "details/sink.hpp"

namespace Strata::Monitor {

    using Sink = Details::Sink;
    using DirectorySink = Details::DirectorySink;
    using Series = Details::Series;
    using History = Details::History;
    using GridOptions = Details::GridOptions;
    using CurveOptions = Details::CurveOptions;

    using Details::make_grid;
    using Details::render_curves;
}

#endif // STRATA_MONITOR_HPP
