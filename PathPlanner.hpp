#pragma once

#include "types.hpp"

// <parent>/<character>/<event>/<YYYY>/<MM>/<DD>/<file_name>. Segments are
// used verbatim; nothing is sanitized.
PathPlan plan_destination(const ScreenshotMetadata& meta,
                          const fs::path& parent_dir,
                          const fs::path& file_name);
