#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

enum class ErrorKind { InvalidFormat, IOError, LogWriteError };

struct ParseError {
  ErrorKind kind = ErrorKind::InvalidFormat;
  std::string reason;
};

struct IoError {
  ErrorKind kind = ErrorKind::IOError;
  std::string message;
};

// Batch-level warning; moves already done stand.
struct LogWriteFailure {
  ErrorKind kind = ErrorKind::LogWriteError;
  std::string message;
};

// Fields decoded from "YYYY-MM-DD_<timestamp>_<character>_<event>".
struct ScreenshotMetadata {
  std::string capture_date;
  std::string timestamp;
  std::string character_name;
  std::string event_type;
  // Numeric token appended after the event label, if any.
  std::string trailing_token;

  std::string year() const { return capture_date.substr(0, 4); }
  std::string month() const { return capture_date.substr(5, 2); }
  std::string day() const { return capture_date.substr(8, 2); }

  std::string reconstruct_stem() const {
    std::string stem = capture_date + "_" + timestamp + "_" + character_name +
                       "_" + event_type;
    if (!trailing_token.empty()) {
      stem += "_" + trailing_token;
    }
    return stem;
  }
};

struct PathPlan {
  // character, event, year, month, day; each nested in the previous one.
  std::vector<fs::path> directories;
  fs::path destination;
};

struct PlannedMove {
  fs::path from;
  std::optional<ScreenshotMetadata> metadata;
  std::optional<PathPlan> plan;
  std::string error;
};

enum class Outcome { Moved, Skipped, Errored };

struct LogEntry {
  std::string source_file_name;
  fs::path source_path;
  Outcome outcome = Outcome::Skipped;
  std::optional<ScreenshotMetadata> metadata;
  std::optional<fs::path> destination_path;
  std::optional<std::string> exif_date;
  std::string error_message;
};

struct BatchResult {
  std::chrono::system_clock::time_point started_at;
  std::vector<LogEntry> entries;
  std::optional<fs::path> log_path;
  std::optional<LogWriteFailure> log_write_error;

  size_t count(Outcome outcome) const {
    size_t n = 0;
    for (const auto& entry : entries) {
      if (entry.outcome == outcome) ++n;
    }
    return n;
  }
  size_t moved_count() const { return count(Outcome::Moved); }
  size_t skipped_count() const { return count(Outcome::Skipped); }
  size_t errored_count() const { return count(Outcome::Errored); }
};

struct Config {
  bool stop_on_invalid_name = false;
  bool read_exif = true;
  std::vector<std::string> image_extensions = {".png",  ".jpg", ".jpeg",
                                               ".tiff", ".tif", ".webp"};
  fs::path journal_path;
  fs::path log_file = "screenshot_sorter.log";
};

inline void from_json(const json& j, Config& c) {
  if (j.contains("stop_on_invalid_name")) {
    j.at("stop_on_invalid_name").get_to(c.stop_on_invalid_name);
  }
  if (j.contains("read_exif")) {
    j.at("read_exif").get_to(c.read_exif);
  }
  if (j.contains("image_extensions")) {
    j.at("image_extensions").get_to(c.image_extensions);
  }
  if (j.contains("journal_path")) {
    c.journal_path = j.at("journal_path").get<std::string>();
  }
  if (j.contains("log_file")) {
    c.log_file = j.at("log_file").get<std::string>();
  }
}

enum class ActionType { MOVE };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::MOVE, "MOVE"}});
struct JournalEntry {
  ActionType action;
  fs::path from;
  fs::path to;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(JournalEntry, action, from, to);
