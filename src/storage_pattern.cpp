#include "voxstore/storage_pattern.hpp"
#include "voxstore/errors.hpp"
#include "voxstore/utils/quantize.hpp"
#include <sstream>

namespace voxstore {

StoragePattern::StoragePattern(std::vector<Voxel> voxels,
                               PatternLayout layout,
                               BitAccounting bits,
                               fec::ErrorCorrection ecc)
    : voxels_(std::move(voxels)),
      layout_(layout),
      bits_(bits),
      ecc_(ecc),
      ecc_metadata_(ecc.metadata()),
      bits_per_intensity_(utils::bits_for_levels(layout.intensity_levels)),
      bits_per_polarization_(utils::bits_for_levels(layout.polarization_states)) {
    if (!voxels_.empty()) {
        const uint64_t stored = static_cast<uint64_t>(voxels_.size()) *
                                static_cast<uint64_t>(bits_per_voxel());
        if (bits_.encoded_bit_length + bits_.padding_bits != stored) {
            std::ostringstream msg;
            msg << "inconsistent bit accounting: encoded " << bits_.encoded_bit_length
                << " + padding " << bits_.padding_bits << " != " << voxels_.size()
                << " voxels * " << bits_per_voxel() << " bits";
            throw DataError(msg.str());
        }
    }
}

uint64_t StoragePattern::capacity_bits() const {
    return layout_.grid.total() * static_cast<uint64_t>(bits_per_voxel());
}

void StoragePattern::replace_voxels(std::vector<Voxel> voxels) {
    if (voxels.size() != voxels_.size())
        throw DataError("replacement voxel sequence has " + std::to_string(voxels.size()) +
                        " entries, pattern holds " + std::to_string(voxels_.size()));
    voxels_ = std::move(voxels);
}

std::vector<std::pair<std::string, std::string>> StoragePattern::summary() const {
    auto tuple3 = [](auto a, auto b, auto c) {
        std::ostringstream s;
        s << '(' << a << ", " << b << ", " << c << ')';
        return s.str();
    };
    std::ostringstream meta;
    meta << '{';
    bool first = true;
    for (const auto& [k, v] : ecc_metadata_) {
        meta << (first ? "" : ", ") << k << ": " << v;
        first = false;
    }
    meta << '}';

    const auto& g = layout_.grid;
    const auto& p = layout_.pitch;
    return {
        {"grid_size", tuple3(g.x, g.y, g.z)},
        {"voxel_pitch", tuple3(p.x, p.y, p.z)},
        {"intensity_levels", std::to_string(layout_.intensity_levels)},
        {"polarization_states", std::to_string(layout_.polarization_states)},
        {"bits_per_voxel", std::to_string(bits_per_voxel())},
        {"encoded_bit_length", std::to_string(bits_.encoded_bit_length)},
        {"data_bit_length", std::to_string(bits_.data_bit_length)},
        {"padding_bits", std::to_string(bits_.padding_bits)},
        {"error_correction", std::string(ecc_.name())},
        {"error_correction_metadata", meta.str()},
        {"data_length_bytes", std::to_string(bits_.data_length_bytes)},
        {"voxel_count", std::to_string(voxels_.size())},
    };
}

PatternRecord StoragePattern::to_record() const {
    PatternRecord rec;
    rec.voxels.reserve(voxels_.size());
    for (const auto& v : voxels_)
        rec.voxels.push_back({v.x(), v.y(), v.z(), v.intensity(), v.polarization()});
    rec.grid_size = {layout_.grid.x, layout_.grid.y, layout_.grid.z};
    rec.voxel_pitch = {layout_.pitch.x, layout_.pitch.y, layout_.pitch.z};
    rec.intensity_levels = layout_.intensity_levels;
    rec.intensity_range = {layout_.intensity_range.min, layout_.intensity_range.max};
    rec.polarization_states = layout_.polarization_states;
    rec.polarization_range = {layout_.polarization_range.min, layout_.polarization_range.max};
    rec.bits_per_voxel = bits_per_voxel();
    rec.encoded_bit_length = bits_.encoded_bit_length;
    rec.data_bit_length = bits_.data_bit_length;
    rec.padding_bits = bits_.padding_bits;
    rec.error_correction = std::string(ecc_.name());
    rec.error_correction_metadata = ecc_metadata_;
    rec.data_length_bytes = bits_.data_length_bytes;
    return rec;
}

StoragePattern StoragePattern::from_record(const PatternRecord& rec) {
    std::vector<Voxel> voxels;
    voxels.reserve(rec.voxels.size());
    for (const auto& v : rec.voxels)
        voxels.emplace_back(v.x, v.y, v.z, v.intensity, v.polarization);

    PatternLayout layout;
    layout.grid = {rec.grid_size[0], rec.grid_size[1], rec.grid_size[2]};
    layout.pitch = {rec.voxel_pitch[0], rec.voxel_pitch[1], rec.voxel_pitch[2]};
    layout.intensity_levels = rec.intensity_levels;
    layout.intensity_range = {rec.intensity_range[0], rec.intensity_range[1]};
    layout.polarization_states = rec.polarization_states;
    layout.polarization_range = {rec.polarization_range[0], rec.polarization_range[1]};

    BitAccounting bits;
    bits.encoded_bit_length = rec.encoded_bit_length;
    bits.data_bit_length = rec.data_bit_length;
    bits.padding_bits = rec.padding_bits;
    bits.data_length_bytes = rec.data_length_bytes;

    StoragePattern pattern(std::move(voxels), layout, bits,
                           fec::ErrorCorrection::from_name(rec.error_correction));
    if (rec.bits_per_voxel != pattern.bits_per_voxel())
        throw DataError("stored bits_per_voxel " + std::to_string(rec.bits_per_voxel) +
                        " does not match level counts (" +
                        std::to_string(pattern.bits_per_voxel()) + ")");
    // Keep the snapshot as stored.
    if (!rec.error_correction_metadata.empty())
        pattern.ecc_metadata_ = rec.error_correction_metadata;
    return pattern;
}

} // namespace voxstore
