#include "photo_triage/cache/fingerprint.hpp"
#include "photo_triage/core/utils.hpp"

#include <cctype>

namespace photo_triage::cache {

std::string fingerprint_bytes(const std::vector<uint8_t>& bytes) {
    return core::sha256_bytes(bytes);
}

std::string fingerprint_file(const std::filesystem::path& path) {
    return core::sha256_file(path);
}

bool is_valid_fingerprint(const std::string& fingerprint) {
    if (fingerprint.size() != 64) return false;
    for (unsigned char c : fingerprint) {
        if (!std::isxdigit(c) || std::isupper(c)) return false;
    }
    return true;
}

} // namespace photo_triage::cache
