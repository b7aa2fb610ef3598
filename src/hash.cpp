#include "arbiter/hash.hpp"

// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "cas:", "audit:", "ws:" prefixes prevent
//      cross-context collisions. They are part of the hash schema contract.
//
// to_hex() uses a lookup table for nibble encoding instead of snprintf.

#include <array>
#include <fstream>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace arbiter {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_file_blake3_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);

  constexpr std::size_t buffer_size = 65536;
  std::vector<char> buffer(buffer_size);
  while (file.good()) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer_size));
    const std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
    }
  }
  if (file.bad()) return {};
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain("cas:", raw_bytes);
}

std::string audit_entry_hash(std::string_view canonical_entry_json) {
  return hash_domain("audit:", canonical_entry_json);
}

bool is_hex_digest(std::string_view digest) {
  if (digest.size() != 64) return false;
  for (char c : digest) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace arbiter
