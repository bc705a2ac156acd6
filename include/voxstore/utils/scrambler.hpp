#pragma once
#include <cstdint>
#include <span>

namespace voxstore::utils {

// PN9 additive scrambler (x^9 + x^5 + 1). Each call continues the sequence
// from the current state, so scrambling and descrambling must start from the
// same seed. XOR-ing the same keystream twice restores the input.
struct LfsrScrambler {
    uint16_t state{0x1FF};

    static constexpr uint16_t DEFAULT_SEED = 0x1FF;

    // A zero seed would lock the register, it is replaced by DEFAULT_SEED.
    static LfsrScrambler with_seed(uint16_t seed);

    // XOR one keystream byte (8 LFSR steps, MSB-first) into each byte.
    void apply(std::span<uint8_t> bytes);
};

} // namespace voxstore::utils
