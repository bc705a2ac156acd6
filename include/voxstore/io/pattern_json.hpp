#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "voxstore/storage_pattern.hpp"

namespace voxstore::io {

// JSON object with the PatternRecord field names as keys. Doubles are
// written with 17 significant digits so a reload reproduces them exactly.
std::string pattern_to_json(const PatternRecord& rec);

// Throws DataError on malformed input or missing keys. Unknown keys are
// ignored; an unknown error_correction name is kept verbatim and resolved
// to "none" by StoragePattern::from_record().
PatternRecord pattern_from_json(std::string_view text);

// File helpers. Throw std::runtime_error on I/O failure.
void save_pattern(const StoragePattern& pattern, const std::filesystem::path& path);
StoragePattern load_pattern(const std::filesystem::path& path);

} // namespace voxstore::io
