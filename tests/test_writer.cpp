#include <gtest/gtest.h>
#include "voxstore/constants.hpp"
#include "voxstore/debug.hpp"
#include "voxstore/errors.hpp"
#include "voxstore/tx/writer.hpp"
#include "voxstore/utils/quantize.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace voxstore;
using namespace voxstore::tx;

namespace {

WriterConfig config_4x4(fec::Scheme scheme) {
    WriterConfig cfg;
    cfg.grid = {4, 4, 1};
    cfg.intensity_levels = 4;
    cfg.polarization_states = 4;
    cfg.ecc = fec::ErrorCorrection(scheme);
    return cfg;
}

} // namespace

TEST(Writer, RejectsInvalidConfig) {
    auto expect_bad = [](auto mutate) {
        WriterConfig cfg;
        mutate(cfg);
        EXPECT_THROW(LaserWriter{cfg}, ConfigurationError);
    };
    expect_bad([](WriterConfig& c) { c.grid = {0, 4, 4}; });
    expect_bad([](WriterConfig& c) { c.grid = {4, -1, 4}; });
    expect_bad([](WriterConfig& c) { c.grid = {MAX_GRID_DIMENSION + 1, 1, 1}; });
    expect_bad([](WriterConfig& c) { c.pitch = {0.0, 5.0, 5.0}; });
    expect_bad([](WriterConfig& c) { c.intensity_levels = 0; });
    expect_bad([](WriterConfig& c) { c.polarization_states = 3; });
    expect_bad([](WriterConfig& c) { c.intensity_range = {1.0, 1.0}; });
    expect_bad([](WriterConfig& c) { c.polarization_range = {2.0, 1.0}; });
    expect_bad([](WriterConfig& c) { c.intensity_range = {-1.0, 1.0}; });
    expect_bad([](WriterConfig& c) { c.polarization_range = {0.0, 7.0}; });
    expect_bad([](WriterConfig& c) { c.intensity_levels = 1; c.polarization_states = 1; });

    debug::clear_fail();
    WriterConfig cfg;
    cfg.intensity_levels = 5;
    EXPECT_THROW(LaserWriter{cfg}, std::invalid_argument);
    EXPECT_EQ(debug::last_fail_step, debug::kWriteConfig);
}

TEST(Writer, MaxGridDimensionIsAccepted) {
    WriterConfig cfg;
    cfg.grid = {MAX_GRID_DIMENSION, 1, 1};
    EXPECT_NO_THROW(LaserWriter{cfg});
}

TEST(Writer, CapacityBoundary) {
    // 16 voxels * 4 bits = 64 bits.
    LaserWriter plain(config_4x4(fec::Scheme::None));
    EXPECT_NO_THROW((void)plain.write(std::vector<uint8_t>(8, 0x5A)));
    EXPECT_THROW((void)plain.write(std::vector<uint8_t>(9, 0x5A)), CapacityError);

    LaserWriter ham(config_4x4(fec::Scheme::Hamming74));
    EXPECT_NO_THROW((void)ham.write(std::vector<uint8_t>(4, 0x5A)));   // 56 bits
    EXPECT_THROW((void)ham.write(std::vector<uint8_t>(5, 0x5A)), CapacityError); // 70 bits
}

TEST(Writer, CapacityErrorNamesVoxelCounts) {
    LaserWriter plain(config_4x4(fec::Scheme::None));
    const std::string s = "123456789";
    debug::clear_fail();
    try {
        (void)plain.write(std::vector<uint8_t>(s.begin(), s.end()));
        FAIL() << "expected CapacityError";
    } catch (const CapacityError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("requires 18 voxels"), std::string::npos) << msg;
        EXPECT_NE(msg.find("only 16 available"), std::string::npos) << msg;
    }
    EXPECT_EQ(debug::last_fail_step, debug::kWriteCapacity);
}

TEST(Writer, PayloadCeiling) {
    WriterConfig cfg;
    cfg.grid = {MAX_GRID_DIMENSION, MAX_GRID_DIMENSION, 1};
    LaserWriter writer(cfg);
    std::vector<uint8_t> big(MAX_PAYLOAD_BYTES + 1, 0);
    EXPECT_THROW((void)writer.write(big), CapacityError);
}

TEST(Writer, EmptyPayload) {
    LaserWriter writer(config_4x4(fec::Scheme::Hamming74));
    auto p = writer.write({});
    EXPECT_EQ(p.voxel_count(), 0u);
    EXPECT_EQ(p.encoded_bit_length(), 0u);
    EXPECT_EQ(p.padding_bits(), 0u);
    EXPECT_EQ(p.data_length_bytes(), 0u);
}

TEST(Writer, IndexToCoordinates) {
    WriterConfig cfg;
    cfg.grid = {4, 3, 2};
    LaserWriter writer(cfg);
    auto c0 = writer.index_to_coordinates(0);
    EXPECT_EQ(c0.x, 0); EXPECT_EQ(c0.y, 0); EXPECT_EQ(c0.z, 0);
    auto c5 = writer.index_to_coordinates(5);
    EXPECT_EQ(c5.x, 1); EXPECT_EQ(c5.y, 1); EXPECT_EQ(c5.z, 0);
    auto c13 = writer.index_to_coordinates(13);
    EXPECT_EQ(c13.x, 1); EXPECT_EQ(c13.y, 0); EXPECT_EQ(c13.z, 1);
    auto last = writer.index_to_coordinates(23);
    EXPECT_EQ(last.x, 3); EXPECT_EQ(last.y, 2); EXPECT_EQ(last.z, 1);
    EXPECT_THROW(writer.index_to_coordinates(24), std::out_of_range);
}

TEST(Writer, VoxelsLaidOutRowMajor) {
    WriterConfig cfg;
    cfg.grid = {3, 2, 4};
    cfg.intensity_levels = 2;
    cfg.polarization_states = 1;
    cfg.ecc = fec::ErrorCorrection(fec::Scheme::None);
    LaserWriter writer(cfg);
    auto p = writer.write(std::vector<uint8_t>{0xF0, 0x0F});
    ASSERT_EQ(p.voxel_count(), 16u);
    for (size_t i = 0; i < p.voxel_count(); ++i) {
        auto c = writer.index_to_coordinates(i);
        EXPECT_EQ(p.voxels()[i].x(), c.x);
        EXPECT_EQ(p.voxels()[i].y(), c.y);
        EXPECT_EQ(p.voxels()[i].z(), c.z);
        // One bit per voxel in intensity, polarization pinned at the midpoint.
        EXPECT_DOUBLE_EQ(p.voxels()[i].polarization(), cfg.polarization_range.midpoint());
    }
    EXPECT_DOUBLE_EQ(p.voxels()[0].intensity(), cfg.intensity_range.max);
    EXPECT_DOUBLE_EQ(p.voxels()[4].intensity(), cfg.intensity_range.min);
}

TEST(Writer, QuantizedLevelsLandOnGrid) {
    WriterConfig cfg;
    cfg.grid = {4, 1, 1};
    cfg.intensity_levels = 4;
    cfg.polarization_states = 1;
    cfg.intensity_range = {0.0, 0.75};
    cfg.polarization_range = {0.0, 1.0};
    cfg.ecc = fec::ErrorCorrection(fec::Scheme::None);
    LaserWriter writer(cfg);
    // 1000 0000 -> levels 2,0,0,0
    auto p = writer.write(std::vector<uint8_t>{0x80});
    ASSERT_EQ(p.voxel_count(), 4u);
    EXPECT_DOUBLE_EQ(p.voxels()[0].intensity(), 0.5);
    EXPECT_DOUBLE_EQ(p.voxels()[1].intensity(), 0.0);
    EXPECT_DOUBLE_EQ(p.voxels()[0].polarization(), 0.5);
}

TEST(Writer, TopLevelAtFullTurnPolarization) {
    WriterConfig cfg;
    cfg.grid = {4, 4, 1};
    cfg.intensity_levels = 1;
    cfg.polarization_states = 4;
    cfg.polarization_range = {0.2, POLARIZATION_MAX};
    cfg.ecc = fec::ErrorCorrection(fec::Scheme::None);
    LaserWriter writer(cfg);

    // 0xFF -> four voxels at polarization level 3.
    auto p = writer.write(std::vector<uint8_t>{0xFF});
    ASSERT_EQ(p.voxel_count(), 4u);
    for (const auto& v : p.voxels())
        EXPECT_EQ(v.polarization(), POLARIZATION_MAX);
}
