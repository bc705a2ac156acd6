#include "voxstore/utils/bit_codec.hpp"
#include <liquid/liquid.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace voxstore::utils {

BitVector bytes_to_bits(std::span<const uint8_t> data) {
    BitVector bits(data.size() * 8);
    if (data.empty())
        return bits;
    unsigned int written = 0;
    int rc = liquid_unpack_bytes(const_cast<unsigned char*>(data.data()),
                                 static_cast<unsigned int>(data.size()),
                                 bits.data(),
                                 static_cast<unsigned int>(bits.size()),
                                 &written);
    if (rc != LIQUID_OK || written != bits.size())
        throw std::runtime_error("liquid_unpack_bytes failed");
    return bits;
}

ByteVector bits_to_bytes(std::span<const uint8_t> bits) {
    if (bits.empty())
        return {};
    // liquid right-aligns a short final byte; left-align it here instead by
    // padding the input to a whole number of bytes.
    BitVector padded((bits.size() + 7) / 8 * 8, 0);
    for (size_t i = 0; i < bits.size(); ++i)
        padded[i] = bits[i] & 1u;

    ByteVector out(padded.size() / 8);
    unsigned int written = 0;
    int rc = liquid_pack_bytes(padded.data(),
                               static_cast<unsigned int>(padded.size()),
                               out.data(),
                               static_cast<unsigned int>(out.size()),
                               &written);
    if (rc != LIQUID_OK || written != out.size())
        throw std::runtime_error("liquid_pack_bytes failed");
    return out;
}

std::vector<BitVector> chunk_bits(std::span<const uint8_t> bits, int size, bool pad) {
    if (size <= 0)
        throw std::invalid_argument("chunk size must be greater than zero");
    const size_t n = static_cast<size_t>(size);
    std::vector<BitVector> chunks;
    chunks.reserve((bits.size() + n - 1) / n);
    for (size_t off = 0; off < bits.size(); off += n) {
        size_t len = std::min(n, bits.size() - off);
        BitVector chunk(pad ? n : len, 0);
        for (size_t i = 0; i < len; ++i)
            chunk[i] = bits[off + i] & 1u;
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

uint64_t bits_to_int(std::span<const uint8_t> bits) {
    uint64_t v = 0;
    for (uint8_t b : bits)
        v = (v << 1) | (b & 1u);
    return v;
}

BitVector int_to_bits(int64_t value, int width) {
    if (width < 0)
        throw std::invalid_argument("width must be non-negative");
    if (width > 63)
        throw std::invalid_argument("width must not exceed 63 bits");
    if (value < 0)
        throw std::invalid_argument("value must be non-negative");
    if (static_cast<uint64_t>(value) >= (uint64_t{1} << width))
        throw std::invalid_argument("value " + std::to_string(value) +
                                    " does not fit into " + std::to_string(width) + " bits");
    BitVector bits(static_cast<size_t>(width));
    for (int i = 0; i < width; ++i)
        bits[static_cast<size_t>(i)] = static_cast<uint8_t>((value >> (width - 1 - i)) & 1);
    return bits;
}

} // namespace voxstore::utils
