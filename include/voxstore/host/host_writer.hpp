#pragma once
#include <cstdint>
#include <numbers>
#include <optional>
#include <span>

#include "voxstore/fec/ecc.hpp"
#include "voxstore/rx/reader.hpp"
#include "voxstore/storage_pattern.hpp"
#include "voxstore/tx/writer.hpp"
#include "voxstore/utils/scrambler.hpp"

namespace voxstore::host {

struct HostConfig {
    GridSize grid{8, 8, 2};
    VoxelPitch pitch{5.0, 5.0, 20.0};
    int intensity_levels = 4;
    int polarization_states = 4;
    ValueRange intensity_range{0.15, 1.0};
    ValueRange polarization_range{0.0, std::numbers::pi};
    fec::ErrorCorrection ecc{fec::Scheme::Hamming74};
    // Whiten the framed payload with a PN9 keystream before writing.
    bool scramble = true;
    uint16_t scramble_seed = utils::LfsrScrambler::DEFAULT_SEED;
    // Append a CRC16-CCITT trailer so readback can tell good data from bad.
    bool crc = true;
};

struct HostReadback {
    // Payload with the trailer stripped and scrambling undone.
    ByteVector data;
    // True when the trailer matched, or when no trailer is configured.
    bool crc_ok{false};
    rx::ReadResult read_result;
};

// Frames, scrambles and writes payloads on top of the core writer, and undoes
// all of it on readback. The core pipeline sees only opaque bytes.
class HostWriter {
public:
    explicit HostWriter(const HostConfig& config);

    // Throws CapacityError when the framed payload does not fit.
    [[nodiscard]] StoragePattern write(std::span<const uint8_t> data) const;

    // Read back `pattern`, or `voxels_override` when given (noisy measurements).
    [[nodiscard]] HostReadback verify(const StoragePattern& pattern,
                                      std::optional<std::span<const Voxel>> voxels_override = std::nullopt) const;

    const HostConfig& config() const { return config_; }

private:
    void scramble(std::span<uint8_t> bytes) const;

    HostConfig config_;
    tx::LaserWriter writer_;
};

} // namespace voxstore::host
