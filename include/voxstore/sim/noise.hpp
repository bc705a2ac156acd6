#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "voxstore/storage_pattern.hpp"
#include "voxstore/voxel.hpp"

namespace voxstore::sim {

// Measurement model: each voxel's intensity and polarization receive
// independent additive Gaussian noise, then are clamped back into the
// pattern's configured ranges. The pattern itself is left untouched.
//
// The same seed always yields the same sequence; without a seed the
// generator is seeded from std::random_device. A standard deviation of zero
// leaves that property as written; negative or non-finite values throw
// ConfigurationError.
std::vector<Voxel> apply_gaussian_noise(const StoragePattern& pattern,
                                        double intensity_std,
                                        double polarization_std,
                                        std::optional<uint32_t> seed = std::nullopt);

} // namespace voxstore::sim
