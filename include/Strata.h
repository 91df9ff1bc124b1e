#ifndef STRATA_LIBRARY_H
#define STRATA_LIBRARY_H

// Public umbrella header.
// -----------------------------------------------------------------------------
// Everything is header-only under src/; downstream code includes this file and
// links against LibTorch, OpenCV and Boost.

#include "../src/core.hpp"

#include "../src/common/checkpoint.hpp"
#include "../src/config/config.hpp"
#include "../src/data/data.hpp"
#include "../src/ema/ema.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/loss/loss.hpp"
#include "../src/monitor/monitor.hpp"
#include "../src/network/network.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/regularization/regularization.hpp"
#include "../src/schedule/schedule.hpp"
#include "../src/training/adversarial.hpp"
#include "../src/training/context.hpp"

#endif // STRATA_LIBRARY_H
