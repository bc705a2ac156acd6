#pragma once
#include <cstddef>
#include <numbers>

namespace voxstore {

// Sanity ceiling on every lattice axis. 10k x 10k x 10k is already far
// beyond anything a simulation run should allocate.
inline constexpr int MAX_GRID_DIMENSION = 10'000;

// Largest payload accepted by the writer, in bytes.
inline constexpr size_t MAX_PAYLOAD_BYTES = 1'000'000;

// Polarization is an angle in radians, bounded to one full turn.
inline constexpr double POLARIZATION_MAX = 2.0 * std::numbers::pi;

} // namespace voxstore
