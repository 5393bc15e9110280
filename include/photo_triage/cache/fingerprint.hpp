#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace photo_triage::cache {

// SHA-256 hex digest of the raw bytes. Path, name and mtime never
// contribute to the identity of an image.
std::string fingerprint_bytes(const std::vector<uint8_t> &bytes);

// Throws IOError when the file cannot be read.
std::string fingerprint_file(const std::filesystem::path &path);

bool is_valid_fingerprint(const std::string &fingerprint);

} // namespace photo_triage::cache
