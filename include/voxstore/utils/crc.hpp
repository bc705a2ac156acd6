#pragma once
#include <cstdint>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace voxstore::utils {

// CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF, no reflection, no final
// xor). Used by the host layer to protect a framed payload.
struct Crc16Ccitt {
    static constexpr uint16_t POLY = 0x1021;
    static constexpr uint16_t INIT = 0xFFFF;

    uint16_t compute(std::span<const uint8_t> data) const;

    // Big-endian two byte trailer for `data`.
    std::pair<uint8_t, uint8_t> make_trailer_be(std::span<const uint8_t> data) const;

    // Append the big-endian trailer in place.
    void append_trailer_be(std::vector<uint8_t>& frame) const;

    // Check a frame whose last two bytes are a big-endian trailer. Returns
    // whether it matched and the CRC computed over the body.
    std::pair<bool, uint16_t> verify_trailer_be(std::span<const uint8_t> frame) const;
};

} // namespace voxstore::utils
