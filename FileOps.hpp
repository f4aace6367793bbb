#pragma once

#include <expected>

#include "types.hpp"

// The only place files and directories are touched during a batch.
namespace FileOps {
// Creates `dir` and any missing ancestors. Succeeds if it already exists.
std::expected<void, IoError> ensure_directory(const fs::path& dir);

// Moves `from` to `to`, replacing an existing file at `to`. Falls back to
// copy + remove when the two paths are on different devices.
std::expected<void, IoError> move_file(const fs::path& from,
                                       const fs::path& to);

// Cross-device half of move_file: copy over `to`, then delete `from`.
std::expected<void, IoError> copy_then_remove(const fs::path& from,
                                              const fs::path& to);
}  // namespace FileOps
