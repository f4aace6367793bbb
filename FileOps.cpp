#include "FileOps.hpp"

#include <format>
#include <system_error>

#include "utils.hpp"

namespace {
std::unexpected<IoError> io_error(std::string message) {
  return std::unexpected(IoError{ErrorKind::IOError, std::move(message)});
}
}  // namespace

std::expected<void, IoError> FileOps::ensure_directory(const fs::path& dir) {
  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    return {};
  }
  if (fs::exists(dir, ec)) {
    return io_error(std::format("'{}' exists and is not a directory",
                                safe_path_to_string(dir)));
  }

  fs::create_directories(dir, ec);
  if (ec) {
    return io_error(std::format("Failed to create directory '{}': {}",
                                safe_path_to_string(dir), ec.message()));
  }
  return {};
}

std::expected<void, IoError> FileOps::move_file(const fs::path& from,
                                                const fs::path& to) {
  std::error_code ec;
  if (!fs::is_regular_file(from, ec)) {
    return io_error(std::format(
        "Source '{}' is not a readable file: {}", safe_path_to_string(from),
        ec ? ec.message() : "no such file"));
  }
  if (fs::is_directory(to, ec)) {
    return io_error(std::format("Destination '{}' is a directory",
                                safe_path_to_string(to)));
  }

  std::error_code rename_ec;
  fs::rename(from, to, rename_ec);
  if (!rename_ec) {
    return {};
  }

  if (rename_ec != std::errc::cross_device_link) {
    return io_error(std::format("Failed to move '{}' -> '{}': {}",
                                safe_path_to_string(from),
                                safe_path_to_string(to), rename_ec.message()));
  }

  return copy_then_remove(from, to);
}

std::expected<void, IoError> FileOps::copy_then_remove(const fs::path& from,
                                                       const fs::path& to) {
  std::error_code copy_ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, copy_ec);
  if (copy_ec) {
    return io_error(std::format("Failed to copy '{}' -> '{}': {}",
                                safe_path_to_string(from),
                                safe_path_to_string(to), copy_ec.message()));
  }

  std::error_code remove_ec;
  fs::remove(from, remove_ec);
  if (remove_ec) {
    return io_error(std::format(
        "Copied to '{}' but failed to remove original '{}': {}",
        safe_path_to_string(to), safe_path_to_string(from),
        remove_ec.message()));
  }
  return {};
}
