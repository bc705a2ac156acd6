#include "voxstore/utils/scrambler.hpp"

namespace voxstore::utils {

// PN9 LFSR: shift right and feed back into bit 8. Output bit is the LSB of
// the current state.
static inline uint16_t lfsr9_next(uint16_t s) {
    uint16_t fb = ((s & 0x1u) ^ ((s >> 4) & 0x1u)) & 0x1u; // taps at bit 0 and bit 4
    s = static_cast<uint16_t>((s >> 1) | (fb << 8));
    return static_cast<uint16_t>(s & 0x1FFu);
}

LfsrScrambler LfsrScrambler::with_seed(uint16_t seed) {
    LfsrScrambler s;
    seed &= 0x1FFu;
    s.state = seed ? seed : DEFAULT_SEED;
    return s;
}

void LfsrScrambler::apply(std::span<uint8_t> bytes) {
    uint16_t s = static_cast<uint16_t>((state == 0) ? DEFAULT_SEED : (state & 0x1FFu));
    for (auto& byte : bytes) {
        uint8_t mask = 0;
        for (int b = 0; b < 8; ++b) {
            mask |= static_cast<uint8_t>((s & 0x1u) << (7 - b)); // MSB-first
            s = lfsr9_next(s);
        }
        byte ^= mask;
    }
    state = s;
}

} // namespace voxstore::utils
