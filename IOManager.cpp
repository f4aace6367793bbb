#include "IOManager.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>

#include "utils.hpp"

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

}  // namespace

void IOManager::initialize_logger(const fs::path& logFile) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) {
    g_log_stream.close();
  }
  g_log_stream.open(logFile, std::ios_base::app);
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    if (!configJson.is_object()) {
      log("Error parsing config.json: top level must be an object");
      return std::nullopt;
    }
    return configJson.get<Config>();
  } catch (const json::exception& e) {
    log(std::format("Error parsing config.json: {}", e.what()));
    return std::nullopt;
  }
}

std::vector<JournalEntry> IOManager::journal_from_result(
    const BatchResult& result) {
  std::vector<JournalEntry> journal;
  for (const auto& entry : result.entries) {
    if (entry.outcome == Outcome::Moved && entry.destination_path) {
      journal.push_back(
          {ActionType::MOVE, entry.source_path, *entry.destination_path});
    }
  }
  return journal;
}

bool IOManager::save_journal(const fs::path& journalPath,
                             const std::vector<JournalEntry>& journal) {
  if (journal.empty()) {
    return true;
  }
  std::ofstream j_file(journalPath);
  if (!j_file.is_open()) {
    log(std::format("Error: cannot open journal file {}",
                    safe_path_to_string(journalPath)));
    return false;
  }
  j_file << json(journal).dump(2);
  log(std::format("Journal saved with {} moves to {}.", journal.size(),
                  safe_path_to_string(journalPath)));
  return static_cast<bool>(j_file);
}
