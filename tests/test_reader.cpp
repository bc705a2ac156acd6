#include <gtest/gtest.h>
#include "voxstore/debug.hpp"
#include "voxstore/errors.hpp"
#include "voxstore/rx/reader.hpp"
#include "voxstore/tx/writer.hpp"
#include <string>
#include <type_traits>
#include <vector>

using namespace voxstore;

namespace {

tx::WriterConfig config_4x4(fec::Scheme scheme) {
    tx::WriterConfig cfg;
    cfg.grid = {4, 4, 1};
    cfg.intensity_levels = 4;
    cfg.polarization_states = 4;
    cfg.ecc = fec::ErrorCorrection(scheme);
    return cfg;
}

} // namespace

TEST(Reader, SingleCharacterExample) {
    tx::LaserWriter writer(config_4x4(fec::Scheme::Hamming74));
    auto pattern = writer.write(std::vector<uint8_t>{'A'});
    ASSERT_EQ(pattern.encoded_bit_length(), 14u);
    ASSERT_EQ(pattern.voxel_count(), 4u);
    ASSERT_EQ(pattern.padding_bits(), 2u);

    rx::LaserReader reader(pattern);
    auto res = reader.read();
    EXPECT_EQ(res.data, (ByteVector{'A'}));
    EXPECT_EQ(res.corrected_errors, 0u);
    EXPECT_EQ(res.detected_uncorrectable, 0u);
    EXPECT_EQ(res.voxels_used, 4u);
    EXPECT_EQ(res.raw_bitstream.size(), 14u);
    EXPECT_EQ(res.decoded_payload_bits, (BitVector{0,1,0,0,0,0,0,1}));
}

TEST(Reader, EmptyPattern) {
    tx::LaserWriter writer(config_4x4(fec::Scheme::Parity8));
    auto pattern = writer.write({});
    rx::LaserReader reader(pattern);
    auto res = reader.read();
    EXPECT_TRUE(res.data.empty());
    EXPECT_EQ(res.voxels_used, 0u);
}

TEST(Reader, MeasuredSequenceReplacesStoredOne) {
    tx::LaserWriter writer(config_4x4(fec::Scheme::None));
    auto pattern = writer.write(std::vector<uint8_t>{0x12, 0x34});
    rx::LaserReader reader(pattern);

    // Extra voxels past the encoded length are ignored.
    auto voxels = pattern.voxels();
    voxels.push_back(voxels.front());
    voxels.push_back(voxels.front());
    auto res = reader.read(voxels);
    EXPECT_EQ(res.data, (ByteVector{0x12, 0x34}));
    EXPECT_EQ(res.voxels_used, pattern.voxel_count());
}

TEST(Reader, MissingVoxels) {
    tx::LaserWriter writer(config_4x4(fec::Scheme::Hamming74));
    auto pattern = writer.write(std::vector<uint8_t>{'O', 'K'});
    rx::LaserReader reader(pattern);

    debug::clear_fail();
    EXPECT_THROW((void)reader.read(std::vector<Voxel>{}), DataError);
    EXPECT_EQ(debug::last_fail_step, debug::kReadNoVoxels);

    std::vector<Voxel> half(pattern.voxels().begin(),
                            pattern.voxels().begin() + static_cast<long>(pattern.voxel_count() / 2));
    debug::clear_fail();
    EXPECT_THROW((void)reader.read(half), DataError);
    EXPECT_EQ(debug::last_fail_step, debug::kReadInsufficient);
}

TEST(Reader, CorrectsFlippedLevel) {
    // Intensity only, 2 levels: each voxel carries exactly one encoded bit.
    tx::WriterConfig cfg;
    cfg.grid = {8, 8, 1};
    cfg.intensity_levels = 2;
    cfg.polarization_states = 1;
    cfg.ecc = fec::ErrorCorrection(fec::Scheme::Hamming74);
    tx::LaserWriter writer(cfg);
    auto pattern = writer.write(std::vector<uint8_t>{0xC3});
    ASSERT_EQ(pattern.voxel_count(), 14u);

    auto voxels = pattern.voxels();
    const auto& v = voxels[9];
    double flipped = v.intensity() == cfg.intensity_range.min ? cfg.intensity_range.max
                                                              : cfg.intensity_range.min;
    voxels[9] = Voxel(v.x(), v.y(), v.z(), flipped, v.polarization());

    rx::LaserReader reader(pattern);
    auto res = reader.read(voxels);
    EXPECT_EQ(res.data, (ByteVector{0xC3}));
    EXPECT_EQ(res.corrected_errors, 1u);
    EXPECT_EQ(res.detected_uncorrectable, 0u);
}

TEST(Reader, BindsOnlyToLivePatterns) {
    static_assert(std::is_constructible_v<rx::LaserReader, const StoragePattern&>);
    static_assert(std::is_constructible_v<rx::LaserReader, StoragePattern&>);
    static_assert(!std::is_constructible_v<rx::LaserReader, StoragePattern&&>);
    static_assert(!std::is_constructible_v<rx::LaserReader, StoragePattern>);
    SUCCEED();
}
