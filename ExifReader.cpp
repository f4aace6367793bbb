#include "ExifReader.hpp"

#include <algorithm>
#include <exiv2/exiv2.hpp>
#include <format>
#include <mutex>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;
}

bool is_image_file(const fs::path& path,
                   const std::vector<std::string>& image_extensions) {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  return std::any_of(
      image_extensions.begin(), image_extensions.end(),
      [&](const std::string& e) { return string_to_lower_ascii(e) == ext; });
}

std::optional<std::string> read_exif_capture_date(const fs::path& path) {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    auto it = exifData.findKey(Exiv2::ExifKey("Exif.Photo.DateTimeOriginal"));
    if (it != exifData.end() && it->count() > 0) {
      // EXIF stores "YYYY:MM:DD HH:MM:SS".
      std::string date_str = it->toString();
      if (date_str.length() >= 10) {
        date_str = date_str.substr(0, 10);
        std::replace(date_str.begin(), date_str.end(), ':', '-');
        return date_str;
      }
    }
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}
