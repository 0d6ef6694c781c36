#pragma once

#include <string>
#include <string_view>

namespace karma::util {

// Safe to call repeatedly; false when libsodium cannot initialize.
bool initialize_hashing();

std::string sha256_hex(std::string_view payload);

// SHA-256 over the payload followed by the predecessor hash.
std::string chained_hash(std::string_view payload, std::string_view previous_hash);

}  // namespace karma::util
