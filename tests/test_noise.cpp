#include <gtest/gtest.h>
#include "voxstore/errors.hpp"
#include "voxstore/rx/reader.hpp"
#include "voxstore/sim/noise.hpp"
#include "voxstore/tx/writer.hpp"
#include <limits>
#include <vector>

using namespace voxstore;

namespace {

StoragePattern small_pattern() {
    tx::WriterConfig cfg;
    cfg.grid = {2, 2, 1};
    cfg.intensity_levels = 8;
    cfg.polarization_states = 8;
    cfg.ecc = fec::ErrorCorrection(fec::Scheme::None);
    return tx::LaserWriter(cfg).write(std::vector<uint8_t>{'Z'});
}

} // namespace

TEST(Noise, ClampsIntoConfiguredRanges) {
    auto pattern = small_pattern();
    auto noisy = sim::apply_gaussian_noise(pattern, 10.0, 10.0, 42u);
    ASSERT_EQ(noisy.size(), pattern.voxel_count());
    for (size_t i = 0; i < noisy.size(); ++i) {
        EXPECT_TRUE(pattern.intensity_range().contains(noisy[i].intensity()));
        EXPECT_TRUE(pattern.polarization_range().contains(noisy[i].polarization()));
        EXPECT_EQ(noisy[i].x(), pattern.voxels()[i].x());
        EXPECT_EQ(noisy[i].y(), pattern.voxels()[i].y());
        EXPECT_EQ(noisy[i].z(), pattern.voxels()[i].z());
    }
    // Whatever comes out, the reader still produces a full-length payload.
    rx::LaserReader reader(pattern);
    EXPECT_EQ(reader.read(noisy).data.size(), 1u);
}

TEST(Noise, SeedIsDeterministic) {
    auto pattern = small_pattern();
    auto a = sim::apply_gaussian_noise(pattern, 0.05, 0.05, 7u);
    auto b = sim::apply_gaussian_noise(pattern, 0.05, 0.05, 7u);
    EXPECT_EQ(a, b);
}

TEST(Noise, ZeroDeviationKeepsVoxels) {
    auto pattern = small_pattern();
    auto same = sim::apply_gaussian_noise(pattern, 0.0, 0.0, 1u);
    EXPECT_EQ(same, pattern.voxels());
    auto unseeded = sim::apply_gaussian_noise(pattern, 0.0, 0.0);
    EXPECT_EQ(unseeded, pattern.voxels());
}

TEST(Noise, RejectsInvalidDeviation) {
    auto pattern = small_pattern();
    EXPECT_THROW(sim::apply_gaussian_noise(pattern, -0.1, 0.0), ConfigurationError);
    EXPECT_THROW(sim::apply_gaussian_noise(pattern, 0.0, std::numeric_limits<double>::quiet_NaN()),
                 ConfigurationError);
}
