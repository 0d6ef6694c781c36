#include "karma/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "karma/util/canonical.hpp"

namespace karma::util {

bool initialize_hashing() {
  return sodium_init() >= 0;
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

std::string chained_hash(std::string_view payload, std::string_view previous_hash) {
  crypto_hash_sha256_state state;
  crypto_hash_sha256_init(&state);
  crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char*>(payload.data()),
                            static_cast<unsigned long long>(payload.size()));
  crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char*>(previous_hash.data()),
                            static_cast<unsigned long long>(previous_hash.size()));

  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256_final(&state, digest.data());
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

}  // namespace karma::util
