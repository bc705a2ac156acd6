#include "voxstore/utils/crc.hpp"

namespace voxstore::utils {

uint16_t Crc16Ccitt::compute(std::span<const uint8_t> data) const {
    uint16_t crc = INIT;
    for (uint8_t byte : data) {
        crc ^= static_cast<uint16_t>(byte << 8);
        for (int b = 0; b < 8; ++b) {
            if (crc & 0x8000u) crc = static_cast<uint16_t>((crc << 1) ^ POLY);
            else               crc = static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

std::pair<uint8_t, uint8_t> Crc16Ccitt::make_trailer_be(std::span<const uint8_t> data) const {
    uint16_t c = compute(data);
    return { uint8_t((c >> 8) & 0xFF), uint8_t(c & 0xFF) };
}

void Crc16Ccitt::append_trailer_be(std::vector<uint8_t>& frame) const {
    auto [msb, lsb] = make_trailer_be(frame);
    frame.push_back(msb);
    frame.push_back(lsb);
}

std::pair<bool, uint16_t> Crc16Ccitt::verify_trailer_be(std::span<const uint8_t> frame) const {
    if (frame.size() < 2) return {false, 0};
    uint16_t calc = compute(frame.first(frame.size() - 2));
    uint16_t got  = (uint16_t(frame[frame.size() - 2]) << 8) | uint16_t(frame[frame.size() - 1]);
    return {calc == got, calc};
}

} // namespace voxstore::utils
