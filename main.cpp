#include <exception>
#include <exiv2/exiv2.hpp>
#include <memory>
#include <print>
#include <string_view>
#include <vector>

#include "BatchProcessor.hpp"
#include "IOManager.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {
struct Arguments {
  std::optional<fs::path> configPath;
  bool headless = false;
  std::vector<fs::path> files;
};

void print_usage() {
  std::println(stderr,
               "Usage: screenshot_sorter [--config <file>] [--yes] <files...>");
  std::println(stderr,
               "  Files must be named YYYY-MM-DD_<timestamp>_<character>_"
               "<event>.<ext>");
  std::println(stderr,
               "  --yes  organize immediately without the interactive view");
}

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
  Arguments args;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--yes" || arg == "-y") {
      args.headless = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) return std::nullopt;
      args.configPath = fs::path(argv[++i]);
    } else if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    } else {
      args.files.push_back(fs::absolute(fs::path(argv[i])));
    }
  }
  if (args.files.empty()) return std::nullopt;
  return args;
}

// Explicit --config must load; otherwise the first config.json found wins,
// and defaults apply when there is none.
std::optional<Config> resolve_config(const Arguments& args,
                                     const fs::path& exePath) {
  if (args.configPath) {
    return IOManager::load_config(*args.configPath);
  }

  std::vector<fs::path> configPaths = {exePath / "config.json",
                                       fs::current_path() / "config.json"};
  for (const auto& configPath : configPaths) {
    IOManager::log(std::format("Trying config path: {}",
                               safe_path_to_string(configPath)));
    if (fs::exists(configPath)) {
      IOManager::log(std::format("Found config.json at: {}",
                                 safe_path_to_string(configPath)));
      return IOManager::load_config(configPath);
    }
  }
  IOManager::log("No config.json found. Using defaults.");
  return Config{};
}

int run_headless(const Config& config, const std::vector<fs::path>& files) {
  BatchProcessor processor(config);
  BatchResult result = processor.process_batch(files);

  if (!config.journal_path.empty()) {
    IOManager::save_journal(config.journal_path,
                            IOManager::journal_from_result(result));
  }

  std::println("Moved: {}, Skipped: {}, Errors: {}", result.moved_count(),
               result.skipped_count(), result.errored_count());
  for (const auto& entry : result.entries) {
    if (entry.outcome != Outcome::Moved) {
      std::println("  {}: {}", entry.source_file_name, entry.error_message);
    }
  }
  if (result.log_path) {
    std::println("Log written to {}", safe_path_to_string(*result.log_path));
  }
  if (result.log_write_error) {
    std::println(stderr, "Warning: {}", result.log_write_error->message);
  }

  return (result.errored_count() == 0 && !result.log_write_error) ? 0 : 1;
}
}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();

  try {
    auto args = parse_arguments(argc, argv);
    if (!args) {
      print_usage();
      Exiv2::XmpParser::terminate();
      return 1;
    }

    IOManager::initialize_logger();
    IOManager::log("--- Screenshot Sorter Started ---");

    fs::path exePath;
    if (argc > 0) {
      exePath = fs::path(argv[0]).parent_path();
    }
    if (exePath.empty()) {
      exePath = fs::current_path();
    }

    auto configOpt = resolve_config(*args, exePath);
    if (!configOpt) {
      IOManager::log("CRITICAL: Failed to load configuration.");
      std::println(stderr, "\n=== ERROR ===");
      std::println(stderr, "Failed to load config.json!");
      std::println(stderr, "Check screenshot_sorter.log for details.");
      Exiv2::XmpParser::terminate();
      return 1;
    }
    if (configOpt->log_file != "screenshot_sorter.log") {
      IOManager::initialize_logger(configOpt->log_file);
    }
    IOManager::log(std::format("{} files selected.", args->files.size()));

    int status = 0;
    if (args->headless) {
      status = run_headless(*configOpt, args->files);
    } else {
      IOManager::log("Initializing UI...");
      auto application = std::make_shared<UI>(*configOpt, args->files);
      application->run();
    }

    IOManager::log("--- Screenshot Sorter Exited Normally ---");

    Exiv2::XmpParser::terminate();
    return status;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check screenshot_sorter.log for details.");
    Exiv2::XmpParser::terminate();
    return 1;
  }
}
