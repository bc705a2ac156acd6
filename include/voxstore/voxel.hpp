#pragma once

namespace voxstore {

// A single written site in the medium: lattice position plus the two
// quantized physical properties. Immutable; the constructor throws
// ValidationError when
//  - any coordinate is negative,
//  - intensity is not finite or negative,
//  - polarization is not finite or outside [0, 2*pi].
class Voxel {
public:
    Voxel(int x, int y, int z, double intensity, double polarization);

    int x() const { return x_; }
    int y() const { return y_; }
    int z() const { return z_; }
    double intensity() const { return intensity_; }
    double polarization() const { return polarization_; }

    bool operator==(const Voxel&) const = default;

private:
    int x_;
    int y_;
    int z_;
    double intensity_;
    double polarization_;
};

} // namespace voxstore
