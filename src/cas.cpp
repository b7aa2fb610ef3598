#include "arbiter/cas.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>

#include <zstd.h>

#include "arbiter/fsutil.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {

constexpr int kZstdLevel = 3;

std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), kZstdLevel);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::uint64_t original_size) {
  std::string out;
  out.resize(static_cast<size_t>(original_size));
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}

std::string info_to_json(const CasObjectInfo& info) {
  jsonlite::Object o;
  o["format_version"] = jsonlite::Value{static_cast<std::uint64_t>(version::CAS_FORMAT_VERSION)};
  o["digest"] = jsonlite::Value{info.digest};
  o["encoding"] = jsonlite::Value{info.encoding};
  o["original_size"] = jsonlite::Value{info.original_size};
  o["stored_size"] = jsonlite::Value{info.stored_size};
  o["stored_blob_hash"] = jsonlite::Value{info.stored_blob_hash};
  o["created_at"] = jsonlite::Value{info.created_at_unix_ts};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace

CasStore::CasStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string CasStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string CasStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string CasStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!is_hex_digest(digest)) return {};

  // Already stored: verify before trusting the existing object.
  if (contains(digest)) {
    auto existing = get(digest);
    if (existing && *existing == data) return digest;
    remove(digest);
  }

  std::string stored = data;
  std::string encoding = "identity";
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }

  const std::string target = object_path(digest);
  if (!atomic_write(target, stored)) return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<std::uint64_t>(std::time(nullptr));

  if (!atomic_write(meta_path(digest), info_to_json(info))) {
    // Rollback blob on meta write failure.
    std::error_code ec;
    fs::remove(target, ec);
    return {};
  }
  return digest;
}

std::optional<CasObjectInfo> CasStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  const auto text = read_file_bytes(meta_path(digest));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  CasObjectInfo info;
  info.digest = jsonlite::get_string(obj, "digest");
  info.encoding = jsonlite::get_string(obj, "encoding", "identity");
  info.original_size = jsonlite::get_u64(obj, "original_size");
  info.stored_size = jsonlite::get_u64(obj, "stored_size");
  info.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  info.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (info.digest != digest) return std::nullopt;
  return info;
}

std::optional<std::string> CasStore::get(const std::string& digest, std::string* error) const {
  auto fail = [&](const std::string& why) -> std::optional<std::string> {
    if (error) *error = why;
    return std::nullopt;
  };
  if (!is_hex_digest(digest)) return fail("invalid digest");
  auto data = read_file_bytes(object_path(digest));
  if (!data) return fail("not found");
  const auto meta = info(digest);
  if (!meta) return fail("metadata missing or unreadable");

  // Stored blob integrity (plain BLAKE3, no domain prefix).
  if (blake3_hex(*data) != meta->stored_blob_hash) return fail("stored blob hash mismatch");

  std::string content;
  if (meta->encoding == "zstd") {
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) return fail("zstd decompression failed");
    content = std::move(*plain);
  } else if (meta->encoding == "identity") {
    content = std::move(*data);
  } else {
    return fail("unknown encoding " + meta->encoding);
  }

  if (cas_content_hash(content) != digest) return fail("content digest mismatch");
  return content;
}

bool CasStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec);
}

bool CasStore::remove(const std::string& digest) {
  if (!is_hex_digest(digest)) return false;
  std::error_code ec;
  fs::remove(object_path(digest), ec);
  if (ec) return false;
  fs::remove(meta_path(digest), ec);
  return !ec;
}

std::vector<CasObjectInfo> CasStore::scan_objects() const {
  std::vector<CasObjectInfo> out;
  std::error_code ec;
  fs::recursive_directory_iterator it(fs::path(root_) / "objects", ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (it->is_regular_file(ec) && is_hex_digest(name)) {
      if (auto inf = info(name)) out.push_back(std::move(*inf));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const CasObjectInfo& a, const CasObjectInfo& b) { return a.digest < b.digest; });
  return out;
}

}  // namespace arbiter
