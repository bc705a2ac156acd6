#include "voxstore/utils/quantize.hpp"
#include "voxstore/errors.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <string>

namespace voxstore::utils {

int bits_for_levels(int levels) {
    if (levels <= 0)
        throw ConfigurationError("levels must be positive, got " + std::to_string(levels));
    auto u = static_cast<unsigned>(levels);
    if (!std::has_single_bit(u))
        throw ConfigurationError("levels must be a power of two for binary encoding, got " +
                                 std::to_string(levels));
    return static_cast<int>(std::bit_width(u)) - 1;
}

double level_to_physical(int level, int levels, const ValueRange& range) {
    if (levels == 1)
        return range.midpoint();
    level = std::clamp(level, 0, levels - 1);
    if (level == levels - 1)
        return range.max;
    const double step = range.width() / static_cast<double>(levels - 1);
    return std::min(range.min + static_cast<double>(level) * step, range.max);
}

int physical_to_level(double value, int levels, const ValueRange& range) {
    if (levels <= 1 || std::isnan(value))
        return 0;
    const double step = range.width() / static_cast<double>(levels - 1);
    if (step <= 0.0)
        return 0;
    const double v = std::clamp(value, range.min, range.max);
    const long level = std::lround((v - range.min) / step);
    return static_cast<int>(std::clamp<long>(level, 0, levels - 1));
}

} // namespace voxstore::utils
