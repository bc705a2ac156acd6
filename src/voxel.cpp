#include "voxstore/voxel.hpp"
#include "voxstore/constants.hpp"
#include "voxstore/errors.hpp"
#include <cmath>

namespace voxstore {

Voxel::Voxel(int x, int y, int z, double intensity, double polarization)
    : x_(x), y_(y), z_(z), intensity_(intensity), polarization_(polarization) {
    if (x < 0 || y < 0 || z < 0)
        throw ValidationError("voxel coordinates must be non-negative");
    if (!std::isfinite(intensity) || intensity < 0.0)
        throw ValidationError("intensity must be finite and non-negative");
    if (!std::isfinite(polarization) || polarization < 0.0 || polarization > POLARIZATION_MAX)
        throw ValidationError("polarization angle must be within [0, 2*pi]");
}

} // namespace voxstore
