#pragma once

#include <chrono>
#include <expected>
#include <string>

#include "types.hpp"

// The per-batch audit log, "<YYYY-MM-DD_HHMMSS>_Metadata_Log.txt".
namespace BatchLog {
// Stamped with the local wall clock unless another zone is given.
std::string log_file_name(
    std::chrono::system_clock::time_point started_at,
    const std::chrono::time_zone* zone = std::chrono::current_zone());

// One block per entry, no trailing blank line.
std::string format_entry(const LogEntry& entry);

// Blocks in input order, separated by a blank line.
std::string format_log(const std::vector<LogEntry>& entries);

// Appends format_log(result.entries) to <dir>/log_file_name(...) and returns
// the written path.
std::expected<fs::path, LogWriteFailure> write_batch_log(
    const fs::path& dir, const BatchResult& result);
}  // namespace BatchLog
