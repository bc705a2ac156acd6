#pragma once
#include <cstdint>
#include <numbers>
#include <span>

#include "voxstore/fec/ecc.hpp"
#include "voxstore/storage_pattern.hpp"
#include "voxstore/types.hpp"

namespace voxstore::tx {

struct WriterConfig {
    // Lattice dimensions, each in [1, MAX_GRID_DIMENSION].
    GridSize grid{64, 64, 32};
    // Site spacing in micrometres. Recorded in the pattern, not used for coding.
    VoxelPitch pitch{5.0, 5.0, 20.0};
    // Level counts must be powers of two. A count of 1 disables that property.
    int intensity_levels = 16;
    int polarization_states = 8;
    // Physical ranges the levels are spread over, min < max.
    ValueRange intensity_range{0.15, 1.0};
    ValueRange polarization_range{0.0, std::numbers::pi};
    fec::ErrorCorrection ecc{fec::Scheme::Hamming74};
};

// Turns payload bytes into a StoragePattern:
//   bytes -> bits -> FEC -> zero padding -> one chunk of bits_per_voxel()
//   bits per lattice site, split into an intensity level and a polarization
//   level, each mapped to its physical value.
class LaserWriter {
public:
    // Throws ConfigurationError on an invalid configuration.
    explicit LaserWriter(const WriterConfig& config);

    // Throws CapacityError when the encoded payload needs more voxels than
    // the lattice has, or the payload exceeds MAX_PAYLOAD_BYTES.
    [[nodiscard]] StoragePattern write(std::span<const uint8_t> data) const;

    const WriterConfig& config() const { return config_; }
    int bits_per_intensity() const { return bits_per_intensity_; }
    int bits_per_polarization() const { return bits_per_polarization_; }
    int bits_per_voxel() const { return bits_per_intensity_ + bits_per_polarization_; }

    // Row-major lattice position of the voxel at `index`.
    // Throws std::out_of_range past the last plane.
    LatticeCoord index_to_coordinates(uint64_t index) const;

private:
    WriterConfig config_;
    int bits_per_intensity_{0};
    int bits_per_polarization_{0};
};

} // namespace voxstore::tx
