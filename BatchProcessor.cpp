#include "BatchProcessor.hpp"

#include <format>

#include "BatchLog.hpp"
#include "ExifReader.hpp"
#include "FileOps.hpp"
#include "FilenameParser.hpp"
#include "IOManager.hpp"
#include "PathPlanner.hpp"
#include "utils.hpp"

BatchProcessor::BatchProcessor(const Config& config) : m_config(config) {}

std::vector<PlannedMove> BatchProcessor::preview(
    const std::vector<fs::path>& files) const {
  std::vector<PlannedMove> moves;
  moves.reserve(files.size());
  for (const auto& file : files) {
    PlannedMove move{file, std::nullopt, std::nullopt, {}};
    if (auto meta = parse_filename(file)) {
      move.plan =
          plan_destination(*meta, file.parent_path(), file.filename());
      move.metadata = std::move(*meta);
    } else {
      move.error = meta.error().reason;
    }
    moves.push_back(std::move(move));
  }
  return moves;
}

BatchResult BatchProcessor::process_batch(
    const std::vector<fs::path>& files,
    std::chrono::system_clock::time_point started_at) const {
  BatchResult result;
  result.started_at = started_at;
  result.entries.reserve(files.size());

  IOManager::log(std::format("Processing batch of {} files...", files.size()));

  bool stopped = false;
  for (const auto& file : files) {
    if (stopped) {
      LogEntry entry;
      entry.source_file_name = safe_path_to_string(file.filename());
      entry.source_path = file;
      entry.outcome = Outcome::Skipped;
      entry.error_message =
          "not processed: batch stopped after invalid filename";
      result.entries.push_back(std::move(entry));
      continue;
    }

    result.entries.push_back(process_file(file));
    if (result.entries.back().outcome == Outcome::Skipped &&
        m_config.stop_on_invalid_name) {
      IOManager::log("Invalid filename encountered; stopping batch.");
      stopped = true;
    }
  }

  if (!files.empty()) {
    const fs::path log_dir = files.front().parent_path();
    if (auto written = BatchLog::write_batch_log(log_dir, result)) {
      result.log_path = *written;
      IOManager::log(std::format("Batch log written to '{}'",
                                 safe_path_to_string(*written)));
    } else {
      result.log_write_error = written.error();
      IOManager::log(std::format("Warning: {}", written.error().message));
    }
  }

  IOManager::log(std::format("Batch complete. Moved {}, skipped {}, errors {}.",
                             result.moved_count(), result.skipped_count(),
                             result.errored_count()));
  return result;
}

LogEntry BatchProcessor::process_file(const fs::path& file) const {
  LogEntry entry;
  entry.source_file_name = safe_path_to_string(file.filename());
  entry.source_path = file;

  auto meta = parse_filename(file);
  if (!meta) {
    entry.outcome = Outcome::Skipped;
    entry.error_message = meta.error().reason;
    IOManager::log(std::format("Skipping '{}': {}", entry.source_file_name,
                               entry.error_message));
    return entry;
  }
  entry.metadata = *meta;

  try {
    const PathPlan plan =
        plan_destination(*meta, file.parent_path(), file.filename());
    entry.destination_path = plan.destination;

    if (m_config.read_exif && is_image_file(file, m_config.image_extensions)) {
      check_exif_date(file, entry);
    }

    for (const auto& dir : plan.directories) {
      if (auto made = FileOps::ensure_directory(dir); !made) {
        entry.outcome = Outcome::Errored;
        entry.error_message = made.error().message;
        IOManager::log(std::format("[DIR] {}", entry.error_message));
        return entry;
      }
    }

    IOManager::log(std::format("Moving '{}' -> '{}'",
                               safe_path_to_string(file),
                               safe_path_to_string(plan.destination)));
    if (auto moved = FileOps::move_file(file, plan.destination); !moved) {
      entry.outcome = Outcome::Errored;
      entry.error_message = moved.error().message;
      IOManager::log(std::format("ERROR moving file: {}", entry.error_message));
      return entry;
    }
    entry.outcome = Outcome::Moved;
  } catch (const fs::filesystem_error& e) {
    entry.outcome = Outcome::Errored;
    entry.error_message = e.what();
    IOManager::log(std::format("ERROR processing '{}': {}",
                               entry.source_file_name, e.what()));
  } catch (const std::exception& e) {
    entry.outcome = Outcome::Errored;
    entry.error_message = e.what();
    IOManager::log(std::format("ERROR processing '{}': {}",
                               entry.source_file_name, e.what()));
  }
  return entry;
}

void BatchProcessor::check_exif_date(const fs::path& file,
                                     LogEntry& entry) const {
  entry.exif_date = read_exif_capture_date(file);
  if (entry.exif_date && entry.metadata &&
      *entry.exif_date != entry.metadata->capture_date) {
    IOManager::log(std::format(
        "Warning: '{}' is named for {} but EXIF says it was taken {}",
        entry.source_file_name, entry.metadata->capture_date,
        *entry.exif_date));
  }
}
