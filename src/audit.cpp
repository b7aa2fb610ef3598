#include "arbiter/audit.hpp"

#include <cstdio>
#include <fstream>
#include <mutex>

#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"

namespace arbiter {

struct CommandAuditLog::Impl {
  mutable std::mutex mu;
  FILE* file{nullptr};
  std::vector<CommandLog> entries;
  uint64_t seq{0};
  uint64_t stream_failures{0};
  std::string last_digest{kAuditGenesisDigest};
};

CommandAuditLog::CommandAuditLog(const std::string& stream_path)
    : stream_path_(stream_path), impl_(std::make_unique<Impl>()) {
  if (!stream_path_.empty()) {
    impl_->file = std::fopen(stream_path_.c_str(), "a");
  }
}

CommandAuditLog::~CommandAuditLog() {
  if (impl_ && impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool CommandAuditLog::append(CommandLog& entry) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  entry.sequence_no = ++impl_->seq;
  entry.previous_digest = impl_->last_digest;
  entry.digest = audit_entry_hash(command_log_canonical(entry));
  impl_->last_digest = entry.digest;
  impl_->entries.push_back(entry);

  if (stream_path_.empty()) return true;
  if (!impl_->file) {
    ++impl_->stream_failures;
    return false;
  }

  // Seek to end before writing so the stream stays append-only even if the
  // file position was moved externally.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  const std::string line = jsonlite::to_json(command_log_to_value(entry)) + "\n";
  const bool written =
      std::fwrite(line.data(), 1, line.size(), impl_->file) == line.size() &&
      std::fflush(impl_->file) == 0;
  const long post_write_pos = std::ftell(impl_->file);
  if (!written || pre_write_pos < 0 ||
      post_write_pos < pre_write_pos + static_cast<long>(line.size())) {
    ++impl_->stream_failures;
    return false;
  }
  return true;
}

std::vector<CommandLog> CommandAuditLog::entries() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entries;
}

std::string CommandAuditLog::head_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

uint64_t CommandAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entries.size();
}

uint64_t CommandAuditLog::stream_failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->stream_failures;
}

AuditVerification verify_audit_chain(const std::vector<CommandLog>& entries) {
  AuditVerification v;
  std::string expected_prev = kAuditGenesisDigest;
  uint64_t expected_seq = 1;
  for (const auto& e : entries) {
    ++v.entries;
    if (e.sequence_no != expected_seq) {
      v.ok = false;
      v.first_bad_sequence = e.sequence_no;
      v.reason = "sequence gap: expected " + std::to_string(expected_seq);
      return v;
    }
    if (e.previous_digest != expected_prev) {
      v.ok = false;
      v.first_bad_sequence = e.sequence_no;
      v.reason = "previous_digest does not match preceding entry";
      return v;
    }
    if (audit_entry_hash(command_log_canonical(e)) != e.digest) {
      v.ok = false;
      v.first_bad_sequence = e.sequence_no;
      v.reason = "entry digest mismatch";
      return v;
    }
    expected_prev = e.digest;
    ++expected_seq;
  }
  v.head_digest = expected_prev;
  return v;
}

AuditVerification verify_audit_stream(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    AuditVerification v;
    v.ok = false;
    v.reason = "cannot open " + path;
    return v;
  }
  std::vector<CommandLog> entries;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    if (err) {
      AuditVerification v;
      v.ok = false;
      v.entries = entries.size();
      v.first_bad_sequence = entries.size() + 1;
      v.reason = "malformed line: " + err->message;
      return v;
    }
    entries.push_back(command_log_from_object(obj));
  }
  return verify_audit_chain(entries);
}

}  // namespace arbiter
