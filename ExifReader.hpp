#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Exif.Photo.DateTimeOriginal as "YYYY-MM-DD", if the image carries one.
// Exiv2 failures are logged and treated as "no date".
std::optional<std::string> read_exif_capture_date(const fs::path& path);

bool is_image_file(const fs::path& path,
                   const std::vector<std::string>& image_extensions);
