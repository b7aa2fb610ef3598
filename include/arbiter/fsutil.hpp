#pragma once

// arbiter/fsutil.hpp — Small filesystem helpers shared by the CAS, the
// dataset index, sandbox metadata and the evaluator's result files.

#include <optional>
#include <string>

namespace arbiter {

// Write to a temp file in the same directory, then rename into place.
// Parent directories are created. Returns false on any failure and leaves
// no temp file behind.
bool atomic_write(const std::string& target, const std::string& data);

// Whole-file read. nullopt when the file cannot be opened or read.
std::optional<std::string> read_file_bytes(const std::string& path);

// Temp-file name in dir: ".tmp_<random>".
std::string make_tmp_name(const std::string& dir);

}  // namespace arbiter
