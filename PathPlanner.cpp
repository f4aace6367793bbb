#include "PathPlanner.hpp"

#include "utils.hpp"

PathPlan plan_destination(const ScreenshotMetadata& meta,
                          const fs::path& parent_dir,
                          const fs::path& file_name) {
  PathPlan plan;
  fs::path current = parent_dir;
  for (const auto& segment :
       {meta.character_name, meta.event_type, meta.year(), meta.month(),
        meta.day()}) {
    current /= path_from_utf8(segment);
    plan.directories.push_back(current);
  }
  plan.destination = current / file_name;
  return plan;
}
