#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

#include "voxstore/storage_pattern.hpp"
#include "voxstore/types.hpp"
#include "voxstore/voxel.hpp"

namespace voxstore::rx {

struct ReadResult {
    // Recovered payload, truncated to the original length.
    ByteVector data;
    // FEC diagnostics summed over all blocks.
    size_t corrected_errors{0};
    size_t detected_uncorrectable{0};
    // Voxels consumed to collect the encoded bits.
    size_t voxels_used{0};
    // Encoded bits as measured, padding removed (FEC decoder input).
    BitVector raw_bitstream;
    // FEC decoder output truncated to the payload bit length.
    BitVector decoded_payload_bits;
};

// Recovers the payload of a StoragePattern. The reader borrows the pattern,
// which must outlive it, and never modifies it; concurrent reads of one
// pattern with different measured voxel sequences are fine.
class LaserReader {
public:
    // Throws ConfigurationError if the pattern carries encoded bits but no
    // property encodes information.
    explicit LaserReader(const StoragePattern& pattern);
    // A temporary pattern would dangle.
    explicit LaserReader(StoragePattern&&) = delete;

    // Read the pattern's own voxels.
    [[nodiscard]] ReadResult read() const;

    // Read a measured voxel sequence in place of the stored one, e.g. the
    // output of sim::apply_gaussian_noise(). Throws DataError when the
    // sequence is empty but bits are expected, or runs out before the
    // encoded bit count is reached.
    [[nodiscard]] ReadResult read(std::span<const Voxel> voxels) const;

private:
    const StoragePattern& pattern_;
};

} // namespace voxstore::rx
