#ifndef STRATA_DATA_HPP
#define STRATA_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into the subdirectories
#include "load/load.hpp"
#include "loader.hpp"
#include "transform/augment/augment.hpp"
#include "transform/format/format.hpp"
#endif // STRATA_DATA_HPP
