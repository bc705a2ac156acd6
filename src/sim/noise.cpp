#include "voxstore/sim/noise.hpp"
#include "voxstore/debug.hpp"
#include "voxstore/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <random>

namespace voxstore::sim {

std::vector<Voxel> apply_gaussian_noise(const StoragePattern& pattern,
                                        double intensity_std,
                                        double polarization_std,
                                        std::optional<uint32_t> seed) {
    for (double s : {intensity_std, polarization_std}) {
        if (!std::isfinite(s) || s < 0.0)
            throw ConfigurationError("noise standard deviations must be finite and non-negative");
    }

    std::mt19937 rng(seed ? *seed : std::random_device{}());
    std::normal_distribution<double> inoise(0.0, 1.0);
    std::normal_distribution<double> pnoise(0.0, 1.0);

    const auto& ir = pattern.intensity_range();
    const auto& pr = pattern.polarization_range();

    std::vector<Voxel> noisy;
    noisy.reserve(pattern.voxel_count());
    for (const auto& v : pattern.voxels()) {
        double i = v.intensity() + intensity_std * inoise(rng);
        double p = v.polarization() + polarization_std * pnoise(rng);
        noisy.emplace_back(v.x(), v.y(), v.z(),
                           std::clamp(i, ir.min, ir.max),
                           std::clamp(p, pr.min, pr.max));
    }

    if (debug::enabled())
        std::fprintf(stderr, "DEBUG: [noise] %zu voxels, sigma_i=%g sigma_p=%g\n",
                     noisy.size(), intensity_std, polarization_std);
    return noisy;
}

} // namespace voxstore::sim
