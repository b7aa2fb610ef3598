#pragma once

// arbiter/hash.hpp — BLAKE3 hashing authority.
//
// BLAKE3 is the sole hash primitive. Domain prefixes separate the contexts
// that share it:
//   "cas:"    content-addressed dataset artifacts
//   "audit:"  command audit chain entries
//   "ws:"     workspace manifest entries
// The prefixes are part of the on-disk format (HASH_ALGORITHM_VERSION).

#include <string>
#include <string_view>

namespace arbiter {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest.
std::string blake3_hex(std::string_view payload);

// Stream-hash a file with a 64 KB buffer. Returns "" if the file is unreadable.
std::string hash_file_blake3_hex(const std::string& path);

std::string hash_domain(std::string_view domain, std::string_view payload);
std::string cas_content_hash(std::string_view raw_bytes);
std::string audit_entry_hash(std::string_view canonical_entry_json);

// True for a 64-char lowercase hex string.
bool is_hex_digest(std::string_view digest);

}  // namespace arbiter
