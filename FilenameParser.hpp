#pragma once

#include <expected>
#include <string_view>

#include "types.hpp"

// Decodes a stem of the form "YYYY-MM-DD_<timestamp>_<character>_<event>".
// A trailing all-digit token after the event ("..._Hotkey_2") is treated as
// a secondary timestamp, so an event named only with digits is misread.
std::expected<ScreenshotMetadata, ParseError> parse_filename_stem(
    std::string_view stem);

// Same as above, applied to path.stem().
std::expected<ScreenshotMetadata, ParseError> parse_filename(
    const fs::path& path);
