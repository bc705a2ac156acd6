// Lightweight debug hooks for the write/read pipeline.
#pragma once
#include <cstdlib>

namespace voxstore { namespace debug {

// Set VOXSTORE_DEBUG in the environment to get per-stage traces on stderr.
inline bool enabled() { return std::getenv("VOXSTORE_DEBUG") != nullptr; }

enum FailStep : int {
    kNone = 0,
    kWriteConfig = 1,
    kWriteCapacity = 2,
    kReadNoVoxels = 3,
    kReadInsufficient = 4,
};

inline thread_local int last_fail_step = kNone; // set by writer/reader before throwing
inline void set_fail(int code) { last_fail_step = code; }
inline void clear_fail() { last_fail_step = kNone; }

} } // namespace voxstore::debug
