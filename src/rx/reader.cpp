#include "voxstore/rx/reader.hpp"
#include "voxstore/debug.hpp"
#include "voxstore/errors.hpp"
#include "voxstore/utils/bit_codec.hpp"
#include "voxstore/utils/quantize.hpp"
#include <cstdio>
#include <string>

namespace voxstore::rx {

LaserReader::LaserReader(const StoragePattern& pattern) : pattern_(pattern) {
    if (pattern_.bits_per_voxel() <= 0 && pattern_.encoded_bit_length() > 0)
        throw ConfigurationError("pattern does not contain encodable information");
}

ReadResult LaserReader::read() const {
    return read(pattern_.voxels());
}

ReadResult LaserReader::read(std::span<const Voxel> voxels) const {
    const auto& p = pattern_;
    if (voxels.empty() && p.encoded_bit_length() > 0) {
        debug::set_fail(debug::kReadNoVoxels);
        throw DataError("no voxels provided for decoding");
    }

    const size_t required = p.encoded_bit_length() + p.padding_bits();
    const int ibits = p.bits_per_intensity();
    const int pbits = p.bits_per_polarization();

    ReadResult res;
    BitVector& collected = res.raw_bitstream;
    collected.reserve(required + static_cast<size_t>(p.bits_per_voxel()));
    for (const auto& v : voxels) {
        if (collected.size() >= required)
            break;
        if (ibits) {
            int level = utils::physical_to_level(v.intensity(), p.intensity_levels(), p.intensity_range());
            auto b = utils::int_to_bits(level, ibits);
            collected.insert(collected.end(), b.begin(), b.end());
        }
        if (pbits) {
            int level = utils::physical_to_level(v.polarization(), p.polarization_states(), p.polarization_range());
            auto b = utils::int_to_bits(level, pbits);
            collected.insert(collected.end(), b.begin(), b.end());
        }
        res.voxels_used++;
    }

    if (collected.size() < required) {
        debug::set_fail(debug::kReadInsufficient);
        throw DataError("insufficient voxel data to reconstruct payload: have " +
                        std::to_string(collected.size()) + " bits, need " + std::to_string(required));
    }

    collected.resize(required - p.padding_bits());

    auto ecc = p.error_correction().decode(collected);
    res.corrected_errors = ecc.corrected_errors;
    res.detected_uncorrectable = ecc.detected_uncorrectable;
    if (ecc.bits.size() > p.data_bit_length())
        ecc.bits.resize(p.data_bit_length());
    res.decoded_payload_bits = std::move(ecc.bits);

    res.data = utils::bits_to_bytes(res.decoded_payload_bits);
    if (res.data.size() > p.data_length_bytes())
        res.data.resize(p.data_length_bytes());

    if (debug::enabled())
        std::fprintf(stderr, "DEBUG: [reader] %zu voxels -> %zu bits, corrected=%zu uncorrectable=%zu, %zu bytes\n",
                     res.voxels_used, required, res.corrected_errors, res.detected_uncorrectable, res.data.size());
    return res;
}

} // namespace voxstore::rx
