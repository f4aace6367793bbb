#include <gtest/gtest.h>

#include "../FilenameParser.hpp"
#include "../PathPlanner.hpp"

namespace {
ScreenshotMetadata NightFlynHotkey() {
  ScreenshotMetadata meta;
  meta.capture_date = "2025-06-07";
  meta.timestamp = "170210376";
  meta.character_name = "Night'Flyn";
  meta.event_type = "Hotkey";
  return meta;
}
}  // namespace

TEST(PathPlannerTest, BuildsCharacterEventDateHierarchy) {
  const fs::path file = "2025-06-07_170210376_Night'Flyn_Hotkey.png";

  PathPlan plan = plan_destination(NightFlynHotkey(), "/root", file);

  EXPECT_EQ(plan.destination,
            fs::path("/root/Night'Flyn/Hotkey/2025/06/07") / file);
}

TEST(PathPlannerTest, ListsEachLevelInNestingOrder) {
  PathPlan plan =
      plan_destination(NightFlynHotkey(), "/root", "shot.png");

  ASSERT_EQ(plan.directories.size(), 5u);
  EXPECT_EQ(plan.directories[0], fs::path("/root/Night'Flyn"));
  EXPECT_EQ(plan.directories[1], fs::path("/root/Night'Flyn/Hotkey"));
  EXPECT_EQ(plan.directories[2], fs::path("/root/Night'Flyn/Hotkey/2025"));
  EXPECT_EQ(plan.directories[3], fs::path("/root/Night'Flyn/Hotkey/2025/06"));
  EXPECT_EQ(plan.directories[4],
            fs::path("/root/Night'Flyn/Hotkey/2025/06/07"));
  EXPECT_EQ(plan.destination.parent_path(), plan.directories.back());
}

TEST(PathPlannerTest, KeepsSegmentsVerbatim) {
  auto meta = parse_filename_stem("2023-12-31_0_Sir Lancelot_Level Up!");
  ASSERT_TRUE(meta.has_value());

  PathPlan plan = plan_destination(*meta, "/pics", "x.jpg");

  EXPECT_EQ(plan.destination,
            fs::path("/pics/Sir Lancelot/Level Up!/2023/12/31/x.jpg"));
}
