#pragma once
#include <stdexcept>
#include <string>

namespace voxstore {

// Invalid grid, pitch, level count or value range. Raised before any
// encoding work starts.
struct ConfigurationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A Voxel field violates its invariant (negative coordinate, non-finite or
// out-of-range intensity/polarization).
struct ValidationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Payload does not fit into the configured lattice.
struct CapacityError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Not enough (or inconsistent) voxel data to reconstruct a payload.
struct DataError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace voxstore
