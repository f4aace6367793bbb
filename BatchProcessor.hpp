#pragma once

#include <chrono>
#include <vector>

#include "types.hpp"

class BatchProcessor {
 public:
  explicit BatchProcessor(const Config& config);

  // Parses and plans every file without touching the filesystem.
  std::vector<PlannedMove> preview(const std::vector<fs::path>& files) const;

  // Parse -> plan -> create directories -> move, one file at a time in input
  // order. Produces one entry per input file and writes the batch log next to
  // the first file.
  BatchResult process_batch(
      const std::vector<fs::path>& files,
      std::chrono::system_clock::time_point started_at =
          std::chrono::system_clock::now()) const;

 private:
  LogEntry process_file(const fs::path& file) const;
  void check_exif_date(const fs::path& file, LogEntry& entry) const;

  const Config& m_config;
};
