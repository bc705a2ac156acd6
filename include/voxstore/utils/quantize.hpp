#pragma once
#include "voxstore/types.hpp"

namespace voxstore::utils {

// Number of bits carried by one of `levels` quantization levels.
// Throws ConfigurationError unless levels is a positive power of two.
// One level carries no information and yields 0.
int bits_for_levels(int levels);

// Physical value of a level. With a single level the midpoint of the range
// is used; otherwise the level is clamped to [0, levels-1] and mapped onto
// evenly spaced points from range.min to range.max inclusive. The result
// never leaves [range.min, range.max]; the top level is exactly range.max.
double level_to_physical(int level, int levels, const ValueRange& range);

// Nearest level for a physical value. The value is clamped into the range,
// divided by the level step and rounded half away from zero (std::lround),
// then clamped to [0, levels-1]. NaN maps to level 0.
//
// physical_to_level(level_to_physical(L, n, r), n, r) == L for every L.
int physical_to_level(double value, int levels, const ValueRange& range);

} // namespace voxstore::utils
