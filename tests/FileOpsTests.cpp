#include <gtest/gtest.h>

#include "../FileOps.hpp"
#include "TempDirFixture.hpp"

class FileOpsTest : public TempDirTest {};

TEST_F(FileOpsTest, EnsureDirectoryCreatesMissingAncestors) {
  const fs::path dir = test_dir / "a" / "b" / "c";

  auto made = FileOps::ensure_directory(dir);

  ASSERT_TRUE(made.has_value()) << made.error().message;
  EXPECT_TRUE(fs::is_directory(dir));
}

TEST_F(FileOpsTest, EnsureDirectoryIsIdempotent) {
  const fs::path dir = test_dir / "Hero" / "Kill";
  CreateDummyFile("Hero/Kill/keep.txt");

  ASSERT_TRUE(FileOps::ensure_directory(dir).has_value());
  ASSERT_TRUE(FileOps::ensure_directory(dir).has_value());

  EXPECT_TRUE(fs::exists(dir / "keep.txt"));
}

TEST_F(FileOpsTest, EnsureDirectoryFailsWhenAFileIsInTheWay) {
  CreateDummyFile("blocker");

  auto made = FileOps::ensure_directory(test_dir / "blocker");

  ASSERT_FALSE(made.has_value());
  EXPECT_EQ(made.error().kind, ErrorKind::IOError);
}

TEST_F(FileOpsTest, MoveFileRelocatesContent) {
  const fs::path from = CreateDummyFile("in.png", "pixels");
  const fs::path to = test_dir / "out.png";

  auto moved = FileOps::move_file(from, to);

  ASSERT_TRUE(moved.has_value()) << moved.error().message;
  EXPECT_FALSE(fs::exists(from));
  EXPECT_EQ(ReadFile(to), "pixels");
}

TEST_F(FileOpsTest, MoveFileOverwritesExistingDestination) {
  const fs::path from = CreateDummyFile("in.png", "new");
  const fs::path to = CreateDummyFile("out.png", "old");

  auto moved = FileOps::move_file(from, to);

  ASSERT_TRUE(moved.has_value()) << moved.error().message;
  EXPECT_EQ(ReadFile(to), "new");
}

TEST_F(FileOpsTest, MoveFileReportsMissingSource) {
  auto moved =
      FileOps::move_file(test_dir / "gone.png", test_dir / "out.png");

  ASSERT_FALSE(moved.has_value());
  EXPECT_EQ(moved.error().kind, ErrorKind::IOError);
  EXPECT_NE(moved.error().message.find("gone.png"), std::string::npos);
}

TEST_F(FileOpsTest, CopyThenRemoveReplacesDestinationAndDropsSource) {
  const fs::path from = CreateDummyFile("in.png", "new");
  const fs::path to = CreateDummyFile("Hero/out.png", "old");

  auto moved = FileOps::copy_then_remove(from, to);

  ASSERT_TRUE(moved.has_value()) << moved.error().message;
  EXPECT_FALSE(fs::exists(from));
  EXPECT_EQ(ReadFile(to), "new");
}

TEST_F(FileOpsTest, CopyThenRemoveReportsMissingSource) {
  const fs::path to = CreateDummyFile("out.png", "old");

  auto moved = FileOps::copy_then_remove(test_dir / "gone.png", to);

  ASSERT_FALSE(moved.has_value());
  EXPECT_EQ(moved.error().kind, ErrorKind::IOError);
  EXPECT_EQ(ReadFile(to), "old");
}
