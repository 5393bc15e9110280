#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace photo_triage::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
int64_t unix_time_now();

// File utilities
std::vector<fs::path> discover_images(const fs::path& input_dir, const std::string& patterns);
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);

// Writes to a temporary sibling and renames it over `path`.
void write_text_atomic(const fs::path& path, const std::string& text);

// Hash / encoding utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);
std::string base64_encode(const std::vector<uint8_t>& data);

// Math utilities
float median_of(std::vector<float>& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string slugify(const std::string& text, size_t max_words = 4);

// Glob pattern matching (case-insensitive)
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace photo_triage::core
