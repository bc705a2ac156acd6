#include <gtest/gtest.h>
#include "voxstore/constants.hpp"
#include "voxstore/errors.hpp"
#include "voxstore/voxel.hpp"
#include <limits>

using namespace voxstore;

TEST(Voxel, ValidFields) {
    Voxel v(1, 2, 3, 0.5, 1.25);
    EXPECT_EQ(v.x(), 1);
    EXPECT_EQ(v.y(), 2);
    EXPECT_EQ(v.z(), 3);
    EXPECT_DOUBLE_EQ(v.intensity(), 0.5);
    EXPECT_DOUBLE_EQ(v.polarization(), 1.25);
    EXPECT_NO_THROW(Voxel(0, 0, 0, 0.0, 0.0));
    EXPECT_NO_THROW(Voxel(0, 0, 0, 0.0, POLARIZATION_MAX));
}

TEST(Voxel, RejectsInvalidFields) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(Voxel(-1, 0, 0, 0.5, 0.5), ValidationError);
    EXPECT_THROW(Voxel(0, -1, 0, 0.5, 0.5), ValidationError);
    EXPECT_THROW(Voxel(0, 0, -1, 0.5, 0.5), ValidationError);
    EXPECT_THROW(Voxel(0, 0, 0, -0.1, 0.5), ValidationError);
    EXPECT_THROW(Voxel(0, 0, 0, nan, 0.5), ValidationError);
    EXPECT_THROW(Voxel(0, 0, 0, inf, 0.5), ValidationError);
    EXPECT_THROW(Voxel(0, 0, 0, 0.5, -0.01), ValidationError);
    EXPECT_THROW(Voxel(0, 0, 0, 0.5, POLARIZATION_MAX + 1e-9), ValidationError);
    EXPECT_THROW(Voxel(0, 0, 0, 0.5, nan), ValidationError);
}
