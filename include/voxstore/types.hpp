#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxstore {

// One bit per entry, values 0/1.
using BitVector = std::vector<uint8_t>;
using ByteVector = std::vector<uint8_t>;

struct GridSize {
    int x{0};
    int y{0};
    int z{0};

    // Number of voxel sites in the lattice. Computed in 64 bits since the
    // per-axis ceiling allows products well beyond int range.
    uint64_t total() const {
        return static_cast<uint64_t>(x) * static_cast<uint64_t>(y) * static_cast<uint64_t>(z);
    }
    uint64_t plane() const { return static_cast<uint64_t>(x) * static_cast<uint64_t>(y); }

    bool operator==(const GridSize&) const = default;
};

// Position of a site inside the lattice.
struct LatticeCoord {
    int x{0};
    int y{0};
    int z{0};

    bool operator==(const LatticeCoord&) const = default;
};

// Physical spacing between voxel sites, micrometres. Informational only.
struct VoxelPitch {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    bool operator==(const VoxelPitch&) const = default;
};

// Closed interval [min, max] of a physical quantity.
struct ValueRange {
    double min{0.0};
    double max{0.0};

    double width() const { return max - min; }
    double midpoint() const { return (min + max) / 2.0; }
    bool contains(double v) const { return v >= min && v <= max; }

    bool operator==(const ValueRange&) const = default;
};

} // namespace voxstore
