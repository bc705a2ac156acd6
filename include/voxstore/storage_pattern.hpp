#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "voxstore/fec/ecc.hpp"
#include "voxstore/types.hpp"
#include "voxstore/voxel.hpp"

namespace voxstore {

// Lattice and quantization parameters a pattern was written with.
struct PatternLayout {
    GridSize grid;
    VoxelPitch pitch;
    int intensity_levels{1};
    ValueRange intensity_range;
    int polarization_states{1};
    ValueRange polarization_range;
};

// Bit lengths at each stage of the write pipeline.
struct BitAccounting {
    size_t encoded_bit_length{0}; // after FEC, before padding
    size_t data_bit_length{0};    // payload bits before FEC
    size_t padding_bits{0};       // zeros appended to fill the last voxel
    size_t data_length_bytes{0};  // payload length in bytes
};

struct VoxelRecord {
    int x{0};
    int y{0};
    int z{0};
    double intensity{0.0};
    double polarization{0.0};
};

// Plain keyed form of a StoragePattern. Field names match the JSON keys.
struct PatternRecord {
    std::vector<VoxelRecord> voxels;
    std::array<int, 3> grid_size{};
    std::array<double, 3> voxel_pitch{};
    int intensity_levels{1};
    std::array<double, 2> intensity_range{};
    int polarization_states{1};
    std::array<double, 2> polarization_range{};
    int bits_per_voxel{0};
    size_t encoded_bit_length{0};
    size_t data_bit_length{0};
    size_t padding_bits{0};
    std::string error_correction{"none"};
    fec::SchemeMetadata error_correction_metadata;
    size_t data_length_bytes{0};
};

// A written payload: the voxel lattice plus everything needed to read it back.
//
// Voxel i sits at x = i % gx, y = (i % (gx*gy)) / gx, z = i / (gx*gy).
// When the pattern holds voxels,
//     encoded_bit_length + padding_bits == voxel_count * bits_per_voxel
// and the constructor throws DataError otherwise.
class StoragePattern {
public:
    StoragePattern(std::vector<Voxel> voxels,
                   PatternLayout layout,
                   BitAccounting bits,
                   fec::ErrorCorrection ecc);

    const std::vector<Voxel>& voxels() const { return voxels_; }
    size_t voxel_count() const { return voxels_.size(); }

    const PatternLayout& layout() const { return layout_; }
    const GridSize& grid_size() const { return layout_.grid; }
    const VoxelPitch& voxel_pitch() const { return layout_.pitch; }
    int intensity_levels() const { return layout_.intensity_levels; }
    const ValueRange& intensity_range() const { return layout_.intensity_range; }
    int polarization_states() const { return layout_.polarization_states; }
    const ValueRange& polarization_range() const { return layout_.polarization_range; }

    int bits_per_intensity() const { return bits_per_intensity_; }
    int bits_per_polarization() const { return bits_per_polarization_; }
    int bits_per_voxel() const { return bits_per_intensity_ + bits_per_polarization_; }

    const BitAccounting& accounting() const { return bits_; }
    size_t encoded_bit_length() const { return bits_.encoded_bit_length; }
    size_t data_bit_length() const { return bits_.data_bit_length; }
    size_t padding_bits() const { return bits_.padding_bits; }
    size_t data_length_bytes() const { return bits_.data_length_bytes; }

    const fec::ErrorCorrection& error_correction() const { return ecc_; }
    const fec::SchemeMetadata& error_correction_metadata() const { return ecc_metadata_; }

    // Raw lattice capacity in bits, ignoring FEC overhead.
    uint64_t capacity_bits() const;

    // Swap in a different voxel sequence of the same length, e.g. one that
    // went through the noise model. Throws DataError on a length mismatch.
    void replace_voxels(std::vector<Voxel> voxels);

    // Ordered key/value description for printing.
    std::vector<std::pair<std::string, std::string>> summary() const;

    PatternRecord to_record() const;

    // Rebuilds voxels (ValidationError on bad values) and checks the bit
    // accounting (DataError). An unknown scheme name becomes "none".
    static StoragePattern from_record(const PatternRecord& rec);

private:
    std::vector<Voxel> voxels_;
    PatternLayout layout_;
    BitAccounting bits_;
    fec::ErrorCorrection ecc_;
    fec::SchemeMetadata ecc_metadata_;
    int bits_per_intensity_{0};
    int bits_per_polarization_{0};
};

} // namespace voxstore
