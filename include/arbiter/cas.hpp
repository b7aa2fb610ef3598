#pragma once

// arbiter/cas.hpp — Content-addressed store for dataset artifacts.
//
// DESIGN INVARIANTS (must not be broken):
//   1. Key = cas_content_hash(original_bytes): BLAKE3 with the "cas:" domain
//      prefix. Content-addressed, never location-addressed.
//   2. Writes are atomic: tmp+rename in the destination directory.
//   3. Reads verify twice: the stored blob against stored_blob_hash, then the
//      decompressed bytes against the key.
//   4. Fail-closed: any integrity failure returns nullopt, never bad data.
//   5. Deduplication: a second put() of the same content returns the same
//      digest without rewriting.
//
// LAYOUT (CAS_FORMAT_VERSION 2):
//   <root>/objects/AB/CD/<64-char digest>        zstd or identity blob
//   <root>/objects/AB/CD/<64-char digest>.meta   JSON CasObjectInfo

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};          // "identity" | "zstd"
  std::uint64_t original_size{0};
  std::uint64_t stored_size{0};
  std::string stored_blob_hash;              // plain BLAKE3 of the stored bytes
  std::uint64_t created_at_unix_ts{0};
};

class CasStore {
 public:
  explicit CasStore(std::string root);

  // Returns the digest, or "" when the object could not be written.
  // compression: "zstd" or "off".
  std::string put(const std::string& data, const std::string& compression = "zstd");

  // nullopt when missing or when integrity verification fails. On failure
  // *error (if given) says which.
  std::optional<std::string> get(const std::string& digest, std::string* error = nullptr) const;

  std::optional<CasObjectInfo> info(const std::string& digest) const;
  bool contains(const std::string& digest) const;
  bool remove(const std::string& digest);
  std::vector<CasObjectInfo> scan_objects() const;

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;

 private:
  std::string meta_path(const std::string& digest) const;
  std::string root_;
};

}  // namespace arbiter
