#include "FilenameParser.hpp"

#include <algorithm>

#include "utils.hpp"

namespace {
constexpr char kSeparator = '_';
constexpr size_t kDateLength = 10;

std::unexpected<ParseError> invalid_format(std::string reason) {
  return std::unexpected(
      ParseError{ErrorKind::InvalidFormat, std::move(reason)});
}

bool is_ascii_digits(std::string_view sv) {
  return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
}
}  // namespace

std::expected<ScreenshotMetadata, ParseError> parse_filename_stem(
    std::string_view stem) {
  if (!stem.starts_with("20")) {
    return invalid_format("filename does not start with a 20xx year");
  }
  if (stem.length() <= kDateLength || stem[kDateLength] != kSeparator) {
    return invalid_format("date must be followed by an underscore");
  }

  const size_t last = stem.rfind(kSeparator);
  if (last == std::string_view::npos) {
    return invalid_format("no underscore found for event");
  }

  ScreenshotMetadata meta;
  meta.capture_date = std::string(stem.substr(0, kDateLength));

  size_t event_sep = last;
  std::string_view trailing = stem.substr(last + 1);
  if (is_ascii_digits(trailing)) {
    event_sep = stem.rfind(kSeparator, last - 1);
    if (event_sep == std::string_view::npos) {
      return invalid_format("no underscore found before trailing number");
    }
    meta.event_type =
        std::string(stem.substr(event_sep + 1, last - event_sep - 1));
    meta.trailing_token = std::string(trailing);
  } else {
    meta.event_type = std::string(trailing);
  }

  // Checked above: the separator right after the date.
  const size_t first = kDateLength;
  const size_t second = stem.find(kSeparator, first + 1);
  if (second == std::string_view::npos || second >= event_sep) {
    return invalid_format("no underscore found for character name");
  }

  meta.timestamp = std::string(stem.substr(first + 1, second - first - 1));
  meta.character_name =
      std::string(stem.substr(second + 1, event_sep - second - 1));

  if (meta.character_name.empty()) {
    return invalid_format("character name is empty");
  }
  if (meta.event_type.empty()) {
    return invalid_format("event type is empty");
  }
  return meta;
}

std::expected<ScreenshotMetadata, ParseError> parse_filename(
    const fs::path& path) {
  return parse_filename_stem(safe_path_to_string(path.stem()));
}
