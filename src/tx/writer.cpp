#include "voxstore/tx/writer.hpp"
#include "voxstore/constants.hpp"
#include "voxstore/debug.hpp"
#include "voxstore/errors.hpp"
#include "voxstore/utils/bit_codec.hpp"
#include "voxstore/utils/quantize.hpp"
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>

namespace voxstore::tx {

namespace {

void validate_config(const WriterConfig& c) {
    const auto& g = c.grid;
    if (g.x <= 0 || g.y <= 0 || g.z <= 0)
        throw ConfigurationError("grid_size components must be positive");
    if (g.x > MAX_GRID_DIMENSION || g.y > MAX_GRID_DIMENSION || g.z > MAX_GRID_DIMENSION)
        throw ConfigurationError("grid_size dimensions exceed maximum (" +
                                 std::to_string(MAX_GRID_DIMENSION) + ")");
    for (double p : {c.pitch.x, c.pitch.y, c.pitch.z}) {
        if (!std::isfinite(p) || p <= 0.0)
            throw ConfigurationError("voxel_pitch values must be positive");
    }
    if (c.intensity_levels <= 0 || c.polarization_states <= 0)
        throw ConfigurationError("quantisation levels must be positive");
    auto check_range = [](const ValueRange& r, const char* what) {
        if (!std::isfinite(r.min) || !std::isfinite(r.max) || r.min >= r.max)
            throw ConfigurationError(std::string("invalid ") + what);
    };
    check_range(c.intensity_range, "intensity_range");
    check_range(c.polarization_range, "polarization_range");
    // Voxel values must stay representable.
    if (c.intensity_range.min < 0.0)
        throw ConfigurationError("intensity_range must be non-negative");
    if (c.polarization_range.min < 0.0 || c.polarization_range.max > POLARIZATION_MAX)
        throw ConfigurationError("polarization_range must lie within [0, 2*pi]");
}

} // namespace

LaserWriter::LaserWriter(const WriterConfig& config) : config_(config) {
    try {
        validate_config(config_);
        bits_per_intensity_ = utils::bits_for_levels(config_.intensity_levels);
        bits_per_polarization_ = utils::bits_for_levels(config_.polarization_states);
        if (bits_per_voxel() == 0)
            throw ConfigurationError("at least one dimension must encode information");
    } catch (const ConfigurationError&) {
        debug::set_fail(debug::kWriteConfig);
        throw;
    }
}

LatticeCoord LaserWriter::index_to_coordinates(uint64_t index) const {
    const auto& g = config_.grid;
    const uint64_t plane = g.plane();
    const uint64_t z = index / plane;
    if (z >= static_cast<uint64_t>(g.z))
        throw std::out_of_range("index " + std::to_string(index) + " exceeds lattice depth");
    const uint64_t rem = index % plane;
    return {static_cast<int>(rem % static_cast<uint64_t>(g.x)),
            static_cast<int>(rem / static_cast<uint64_t>(g.x)),
            static_cast<int>(z)};
}

StoragePattern LaserWriter::write(std::span<const uint8_t> data) const {
    if (data.size() > MAX_PAYLOAD_BYTES) {
        debug::set_fail(debug::kWriteCapacity);
        throw CapacityError("payload exceeds maximum size (" + std::to_string(MAX_PAYLOAD_BYTES) +
                            " bytes): " + std::to_string(data.size()) + " bytes provided");
    }

    const BitVector payload_bits = utils::bytes_to_bits(data);
    BitVector encoded = config_.ecc.encode(payload_bits);
    const size_t encoded_len = encoded.size();
    const size_t bpv = static_cast<size_t>(bits_per_voxel());

    const uint64_t max_voxels = config_.grid.total();
    const uint64_t required = encoded_len ? (encoded_len + bpv - 1) / bpv : 0;
    if (required > max_voxels) {
        debug::set_fail(debug::kWriteCapacity);
        std::ostringstream msg;
        msg << "data does not fit inside the configured lattice: requires " << required
            << " voxels, only " << max_voxels << " available";
        throw CapacityError(msg.str());
    }

    const size_t padding = static_cast<size_t>(required) * bpv - encoded_len;
    encoded.resize(encoded_len + padding, 0);

    if (debug::enabled())
        std::fprintf(stderr, "DEBUG: [writer] %zu bytes -> %zu encoded bits (%s), %llu voxels, %zu padding\n",
                     data.size(), encoded_len, std::string(config_.ecc.name()).c_str(),
                     static_cast<unsigned long long>(required), padding);

    std::vector<Voxel> voxels;
    voxels.reserve(static_cast<size_t>(required));
    const auto bi = std::span<const uint8_t>(encoded);
    for (uint64_t i = 0; i < required; ++i) {
        const auto chunk = bi.subspan(static_cast<size_t>(i) * bpv, bpv);
        const auto pos = index_to_coordinates(i);
        const auto ibits = chunk.first(static_cast<size_t>(bits_per_intensity_));
        const auto pbits = chunk.subspan(static_cast<size_t>(bits_per_intensity_));
        const int ilevel = static_cast<int>(utils::bits_to_int(ibits));
        const int plevel = static_cast<int>(utils::bits_to_int(pbits));
        voxels.emplace_back(pos.x, pos.y, pos.z,
                            utils::level_to_physical(ilevel, config_.intensity_levels, config_.intensity_range),
                            utils::level_to_physical(plevel, config_.polarization_states, config_.polarization_range));
    }

    PatternLayout layout;
    layout.grid = config_.grid;
    layout.pitch = config_.pitch;
    layout.intensity_levels = config_.intensity_levels;
    layout.intensity_range = config_.intensity_range;
    layout.polarization_states = config_.polarization_states;
    layout.polarization_range = config_.polarization_range;

    BitAccounting bits;
    bits.encoded_bit_length = encoded_len;
    bits.data_bit_length = payload_bits.size();
    bits.padding_bits = padding;
    bits.data_length_bytes = data.size();

    return StoragePattern(std::move(voxels), layout, bits, config_.ecc);
}

} // namespace voxstore::tx
