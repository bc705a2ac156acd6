#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include "voxstore/types.hpp"

namespace voxstore::fec {

// Forward error correction applied to the bitstream before it is laid out
// in voxels. The set of schemes is closed:
//   * None      passes bits through unchanged.
//   * Hamming74 protects each 4-bit group with 3 parity bits and corrects a
//               single flipped bit per 7-bit block.
//   * Parity8   appends one even-parity bit per 8 data bits. Errors are
//               detected, never corrected.
enum class Scheme : uint8_t { None = 0, Hamming74 = 1, Parity8 = 2 };

struct DecodingResult {
    BitVector bits;
    size_t corrected_errors{0};
    size_t detected_uncorrectable{0};
};

// Block geometry keyed "data_bits_per_block" / "encoded_bits_per_block".
using SchemeMetadata = std::map<std::string, int>;

// Hamming(7,4) block layout is [p1, p2, d1, p3, d2, d3, d4] with
//   p1 = d1^d2^d4, p2 = d1^d3^d4, p3 = d2^d3^d4.
// Packed form used by the tables: bit (i-1) holds b_i.
struct Hamming74Tables {
    std::array<uint8_t, 16> enc{}; // index = d1<<3 | d2<<2 | d3<<1 | d4
};

const Hamming74Tables& hamming74_tables();

BitVector hamming74_encode(std::span<const uint8_t> bits);

// Per 7-bit block (input zero-padded to a multiple of 7): the syndrome gives
// the 1-indexed position to flip. After a flip the block is checked twice
// more, once by recomputing the syndrome and once by recomputing p1..p3 from
// the data bits; a failure of either counts the block as uncorrectable.
// This does not catch every double-bit error; some decode silently to the
// wrong nibble with detected_uncorrectable == 0.
DecodingResult hamming74_decode(std::span<const uint8_t> bits);

BitVector parity8_encode(std::span<const uint8_t> bits);
DecodingResult parity8_decode(std::span<const uint8_t> bits);

// Value handle for one of the schemes. Stateless, cheap to copy and safe to
// share between threads.
class ErrorCorrection {
public:
    constexpr ErrorCorrection() = default;
    constexpr explicit ErrorCorrection(Scheme scheme) : scheme_(scheme) {}

    constexpr Scheme scheme() const { return scheme_; }

    // "none", "hamming74" or "parity8".
    std::string_view name() const;

    BitVector encode(std::span<const uint8_t> bits) const;
    DecodingResult decode(std::span<const uint8_t> bits) const;

    // Empty for None.
    SchemeMetadata metadata() const;

    // Unknown names map to Scheme::None.
    static ErrorCorrection from_name(std::string_view name);

    bool operator==(const ErrorCorrection&) const = default;

private:
    Scheme scheme_{Scheme::None};
};

} // namespace voxstore::fec
