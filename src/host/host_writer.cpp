#include "voxstore/host/host_writer.hpp"
#include "voxstore/debug.hpp"
#include "voxstore/utils/crc.hpp"
#include <cstdio>

namespace voxstore::host {

namespace {

tx::WriterConfig to_writer_config(const HostConfig& c) {
    tx::WriterConfig w;
    w.grid = c.grid;
    w.pitch = c.pitch;
    w.intensity_levels = c.intensity_levels;
    w.polarization_states = c.polarization_states;
    w.intensity_range = c.intensity_range;
    w.polarization_range = c.polarization_range;
    w.ecc = c.ecc;
    return w;
}

} // namespace

HostWriter::HostWriter(const HostConfig& config)
    : config_(config), writer_(to_writer_config(config)) {}

void HostWriter::scramble(std::span<uint8_t> bytes) const {
    if (!config_.scramble)
        return;
    auto lfsr = utils::LfsrScrambler::with_seed(config_.scramble_seed);
    lfsr.apply(bytes);
}

StoragePattern HostWriter::write(std::span<const uint8_t> data) const {
    ByteVector frame(data.begin(), data.end());
    if (config_.crc)
        utils::Crc16Ccitt{}.append_trailer_be(frame);
    scramble(frame);
    return writer_.write(frame);
}

HostReadback HostWriter::verify(const StoragePattern& pattern,
                                std::optional<std::span<const Voxel>> voxels_override) const {
    rx::LaserReader reader(pattern);
    HostReadback rb;
    rb.read_result = voxels_override ? reader.read(*voxels_override) : reader.read();

    ByteVector frame = rb.read_result.data;
    scramble(frame);
    if (config_.crc) {
        rb.crc_ok = utils::Crc16Ccitt{}.verify_trailer_be(frame).first;
        if (frame.size() >= 2)
            frame.resize(frame.size() - 2);
    } else {
        rb.crc_ok = true;
    }
    rb.data = std::move(frame);

    if (debug::enabled())
        std::fprintf(stderr, "DEBUG: [host] readback %zu bytes, crc_ok=%d, corrected=%zu\n",
                     rb.data.size(), rb.crc_ok ? 1 : 0, rb.read_result.corrected_errors);
    return rb;
}

} // namespace voxstore::host
