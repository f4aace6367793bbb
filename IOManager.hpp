#pragma once

#include <functional>
#include <optional>

#include "types.hpp"

namespace IOManager {
// Opens the diagnostics log; later calls with a different path reopen it.
void initialize_logger(const fs::path& logFile = "screenshot_sorter.log");

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);
std::optional<Config> load_config(const fs::path& configPath);
std::vector<JournalEntry> journal_from_result(const BatchResult& result);
bool save_journal(const fs::path& journalPath,
                  const std::vector<JournalEntry>& journal);
}  // namespace IOManager
