#pragma once

#include <chrono>
#include <filesystem>
#include <format>
#include <string>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Builds a path from a UTF-8 std::string (the inverse of the above).
inline fs::path path_from_utf8(const std::string& s) {
  return fs::path(reinterpret_cast<const char8_t*>(s.c_str()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

// "2025-06-07_170210" style stamp, whole seconds, wall clock of `zone`.
inline std::string format_batch_stamp(
    std::chrono::system_clock::time_point tp,
    const std::chrono::time_zone* zone = std::chrono::current_zone()) {
  const std::chrono::zoned_time local{
      zone, std::chrono::floor<std::chrono::seconds>(tp)};
  return std::format("{:%Y-%m-%d_%H%M%S}", local);
}
