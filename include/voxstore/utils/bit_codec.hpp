#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include "voxstore/types.hpp"

namespace voxstore::utils {

// Expand each byte into 8 bits, MSB-first. Output size is 8 * data.size().
BitVector bytes_to_bits(std::span<const uint8_t> data);

// Pack bits (MSB-first) into bytes. A trailing group shorter than 8 bits is
// zero-padded on the right before packing. Entries are masked to {0,1}.
ByteVector bits_to_bytes(std::span<const uint8_t> bits);

// Split bits into consecutive groups of `size`. With `pad` the final short
// group is right-padded with zeros, otherwise it is emitted short.
// Throws std::invalid_argument when size <= 0.
std::vector<BitVector> chunk_bits(std::span<const uint8_t> bits, int size, bool pad = false);

// Big-endian conversions.
uint64_t bits_to_int(std::span<const uint8_t> bits);

// Throws std::invalid_argument if value < 0, width < 0, width > 63 or the
// value needs more than `width` bits.
BitVector int_to_bits(int64_t value, int width);

} // namespace voxstore::utils
