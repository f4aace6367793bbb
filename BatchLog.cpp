#include "BatchLog.hpp"

#include <format>
#include <fstream>

#include "utils.hpp"

namespace {
std::unexpected<LogWriteFailure> log_write_failure(std::string message) {
  return std::unexpected(
      LogWriteFailure{ErrorKind::LogWriteError, std::move(message)});
}

std::string_view outcome_label(Outcome outcome) {
  switch (outcome) {
    case Outcome::Moved:
      return "Moved";
    case Outcome::Skipped:
      return "Skipped";
    case Outcome::Errored:
      return "Error";
  }
  return "Unknown";
}
}  // namespace

std::string BatchLog::log_file_name(
    std::chrono::system_clock::time_point started_at,
    const std::chrono::time_zone* zone) {
  return format_batch_stamp(started_at, zone) + "_Metadata_Log.txt";
}

std::string BatchLog::format_entry(const LogEntry& entry) {
  std::string block = std::format("File: {}\n", entry.source_file_name);
  if (entry.metadata) {
    const auto& meta = *entry.metadata;
    block += std::format("Year: {}\nMonth: {}\nDay: {}\n", meta.year(),
                         meta.month(), meta.day());
    block += std::format("Character: {}\nEvent: {}\n", meta.character_name,
                         meta.event_type);
  }
  if (entry.exif_date) {
    block += std::format("EXIF Date: {}\n", *entry.exif_date);
  }
  if (entry.destination_path) {
    block += std::format("Destination: {}\n",
                         safe_path_to_string(*entry.destination_path));
  }
  block += std::format("Status: {}\n", outcome_label(entry.outcome));
  if (!entry.error_message.empty()) {
    block += std::format("Error: {}\n", entry.error_message);
  }
  return block;
}

std::string BatchLog::format_log(const std::vector<LogEntry>& entries) {
  std::string text;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) text += "\n";
    text += format_entry(entries[i]);
  }
  return text;
}

std::expected<fs::path, LogWriteFailure> BatchLog::write_batch_log(
    const fs::path& dir, const BatchResult& result) {
  const fs::path log_path = dir / log_file_name(result.started_at);

  std::ofstream out(log_path, std::ios_base::app);
  if (!out.is_open()) {
    return log_write_failure(std::format("Cannot open log file '{}'",
                                         safe_path_to_string(log_path)));
  }
  out << format_log(result.entries);
  out.flush();
  if (!out) {
    return log_write_failure(std::format("Failed writing log file '{}'",
                                         safe_path_to_string(log_path)));
  }
  return log_path;
}
