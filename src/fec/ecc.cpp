#include "voxstore/fec/ecc.hpp"
#include "voxstore/utils/bit_codec.hpp"
#include <liquid/liquid.h>

namespace voxstore::fec {

namespace {

// Parity-check masks over the packed 7-bit block (bit i-1 = b_i).
constexpr unsigned H1 = 0x55; // b1 b3 b5 b7
constexpr unsigned H2 = 0x66; // b2 b3 b6 b7
constexpr unsigned H3 = 0x78; // b4 b5 b6 b7

uint8_t pack_block(const BitVector& block) {
    uint8_t cw = 0;
    for (size_t i = 0; i < block.size(); ++i)
        cw |= static_cast<uint8_t>((block[i] & 1u) << i);
    return cw;
}

inline uint8_t bit_at(uint8_t cw, int pos1) { return (cw >> (pos1 - 1)) & 1u; }

uint8_t compute_syndrome(uint8_t cw) {
    uint8_t s1 = static_cast<uint8_t>(liquid_bdotprod(cw, H1));
    uint8_t s2 = static_cast<uint8_t>(liquid_bdotprod(cw, H2));
    uint8_t s3 = static_cast<uint8_t>(liquid_bdotprod(cw, H3));
    return static_cast<uint8_t>((s3 << 2) | (s2 << 1) | s1);
}

} // namespace

const Hamming74Tables& hamming74_tables() {
    static const Hamming74Tables T = [] {
        Hamming74Tables t;
        for (int d = 0; d < 16; ++d) {
            uint8_t d1 = (d >> 3) & 1;
            uint8_t d2 = (d >> 2) & 1;
            uint8_t d3 = (d >> 1) & 1;
            uint8_t d4 = (d >> 0) & 1;

            uint8_t p1 = d1 ^ d2 ^ d4;
            uint8_t p2 = d1 ^ d3 ^ d4;
            uint8_t p3 = d2 ^ d3 ^ d4;

            t.enc[d] = static_cast<uint8_t>(p1 | (p2 << 1) | (d1 << 2) | (p3 << 3) |
                                            (d2 << 4) | (d3 << 5) | (d4 << 6));
        }
        return t;
    }();
    return T;
}

BitVector hamming74_encode(std::span<const uint8_t> bits) {
    const auto& T = hamming74_tables();
    auto chunks = utils::chunk_bits(bits, 4, true);
    BitVector out;
    out.reserve(chunks.size() * 7);
    for (const auto& c : chunks) {
        uint8_t nibble = static_cast<uint8_t>((c[0] << 3) | (c[1] << 2) | (c[2] << 1) | c[3]);
        uint8_t cw = T.enc[nibble];
        for (int i = 0; i < 7; ++i)
            out.push_back((cw >> i) & 1u);
    }
    return out;
}

DecodingResult hamming74_decode(std::span<const uint8_t> bits) {
    DecodingResult res;
    auto blocks = utils::chunk_bits(bits, 7, true);
    res.bits.reserve(blocks.size() * 4);
    for (const auto& block : blocks) {
        uint8_t cw = pack_block(block);
        uint8_t pos = compute_syndrome(cw);
        if (pos) {
            cw ^= static_cast<uint8_t>(1u << (pos - 1));
            res.corrected_errors++;
            if (compute_syndrome(cw) != 0) {
                res.detected_uncorrectable++;
            } else {
                uint8_t d1 = bit_at(cw, 3), d2 = bit_at(cw, 5), d3 = bit_at(cw, 6), d4 = bit_at(cw, 7);
                uint8_t ep1 = d1 ^ d2 ^ d4;
                uint8_t ep2 = d1 ^ d3 ^ d4;
                uint8_t ep3 = d2 ^ d3 ^ d4;
                if (ep1 != bit_at(cw, 1) || ep2 != bit_at(cw, 2) || ep3 != bit_at(cw, 4))
                    res.detected_uncorrectable++;
            }
        }
        res.bits.push_back(bit_at(cw, 3));
        res.bits.push_back(bit_at(cw, 5));
        res.bits.push_back(bit_at(cw, 6));
        res.bits.push_back(bit_at(cw, 7));
    }
    return res;
}

BitVector parity8_encode(std::span<const uint8_t> bits) {
    auto chunks = utils::chunk_bits(bits, 8, true);
    BitVector out;
    out.reserve(chunks.size() * 9);
    for (const auto& c : chunks) {
        out.insert(out.end(), c.begin(), c.end());
        out.push_back(static_cast<uint8_t>(liquid_count_ones_mod2(
            static_cast<unsigned int>(utils::bits_to_int(c)))));
    }
    return out;
}

DecodingResult parity8_decode(std::span<const uint8_t> bits) {
    DecodingResult res;
    auto blocks = utils::chunk_bits(bits, 9, true);
    res.bits.reserve(blocks.size() * 8);
    for (const auto& block : blocks) {
        auto data = std::span<const uint8_t>(block).first(8);
        unsigned computed = liquid_count_ones_mod2(static_cast<unsigned int>(utils::bits_to_int(data)));
        if (computed != block[8])
            res.detected_uncorrectable++;
        res.bits.insert(res.bits.end(), data.begin(), data.end());
    }
    return res;
}

std::string_view ErrorCorrection::name() const {
    switch (scheme_) {
    case Scheme::None:      return "none";
    case Scheme::Hamming74: return "hamming74";
    case Scheme::Parity8:   return "parity8";
    }
    return "none";
}

BitVector ErrorCorrection::encode(std::span<const uint8_t> bits) const {
    switch (scheme_) {
    case Scheme::Hamming74: return hamming74_encode(bits);
    case Scheme::Parity8:   return parity8_encode(bits);
    case Scheme::None:      break;
    }
    BitVector out(bits.begin(), bits.end());
    for (auto& b : out) b &= 1u;
    return out;
}

DecodingResult ErrorCorrection::decode(std::span<const uint8_t> bits) const {
    switch (scheme_) {
    case Scheme::Hamming74: return hamming74_decode(bits);
    case Scheme::Parity8:   return parity8_decode(bits);
    case Scheme::None:      break;
    }
    DecodingResult res;
    res.bits.assign(bits.begin(), bits.end());
    for (auto& b : res.bits) b &= 1u;
    return res;
}

SchemeMetadata ErrorCorrection::metadata() const {
    switch (scheme_) {
    case Scheme::Hamming74: return {{"data_bits_per_block", 4}, {"encoded_bits_per_block", 7}};
    case Scheme::Parity8:   return {{"data_bits_per_block", 8}, {"encoded_bits_per_block", 9}};
    case Scheme::None:      break;
    }
    return {};
}

ErrorCorrection ErrorCorrection::from_name(std::string_view name) {
    if (name == "hamming74") return ErrorCorrection(Scheme::Hamming74);
    if (name == "parity8")   return ErrorCorrection(Scheme::Parity8);
    return ErrorCorrection(Scheme::None);
}

} // namespace voxstore::fec
