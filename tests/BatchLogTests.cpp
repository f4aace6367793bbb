#include <gtest/gtest.h>

#include <chrono>

#include "../BatchLog.hpp"
#include "TempDirFixture.hpp"

using namespace std::chrono;

namespace {
system_clock::time_point BatchStart() {
  return sys_days{year{2025} / June / 7} + hours{17} + minutes{2} +
         seconds{10} + milliseconds{376};
}

LogEntry MovedEntry() {
  LogEntry entry;
  entry.source_file_name = "2025-06-07_170210376_Night'Flyn_Hotkey.png";
  entry.outcome = Outcome::Moved;
  entry.metadata = ScreenshotMetadata{"2025-06-07", "170210376", "Night'Flyn",
                                      "Hotkey", ""};
  entry.destination_path =
      fs::path("/root/Night'Flyn/Hotkey/2025/06/07") / entry.source_file_name;
  return entry;
}

LogEntry SkippedEntry() {
  LogEntry entry;
  entry.source_file_name = "holiday.png";
  entry.outcome = Outcome::Skipped;
  entry.error_message = "filename does not start with a 20xx year";
  return entry;
}
}  // namespace

class BatchLogTest : public TempDirTest {};

TEST(BatchLogNameTest, UsesBatchStartToTheSecond) {
  EXPECT_EQ(BatchLog::log_file_name(BatchStart(), locate_zone("UTC")),
            "2025-06-07_170210_Metadata_Log.txt");
}

TEST(BatchLogNameTest, UsesWallClockOfTheZone) {
  // UTC+9 without daylight saving: 17:02 UTC is 02:02 the next day.
  EXPECT_EQ(BatchLog::log_file_name(BatchStart(), locate_zone("Asia/Tokyo")),
            "2025-06-08_020210_Metadata_Log.txt");
}

TEST(BatchLogFormatTest, MovedEntryListsAllFields) {
  EXPECT_EQ(BatchLog::format_entry(MovedEntry()),
            "File: 2025-06-07_170210376_Night'Flyn_Hotkey.png\n"
            "Year: 2025\n"
            "Month: 06\n"
            "Day: 07\n"
            "Character: Night'Flyn\n"
            "Event: Hotkey\n"
            "Destination: /root/Night'Flyn/Hotkey/2025/06/07/"
            "2025-06-07_170210376_Night'Flyn_Hotkey.png\n"
            "Status: Moved\n");
}

TEST(BatchLogFormatTest, SkippedEntryCarriesTheReason) {
  EXPECT_EQ(BatchLog::format_entry(SkippedEntry()),
            "File: holiday.png\n"
            "Status: Skipped\n"
            "Error: filename does not start with a 20xx year\n");
}

TEST(BatchLogFormatTest, BlocksAreSeparatedByABlankLine) {
  const std::string text = BatchLog::format_log({SkippedEntry(), MovedEntry()});

  const auto split = text.find("\n\n");
  ASSERT_NE(split, std::string::npos);
  EXPECT_EQ(text.substr(0, split + 1), BatchLog::format_entry(SkippedEntry()));
  EXPECT_EQ(text.substr(split + 2), BatchLog::format_entry(MovedEntry()));
}

TEST_F(BatchLogTest, WritesIntoTheGivenDirectory) {
  BatchResult result;
  result.started_at = BatchStart();
  result.entries = {MovedEntry()};

  auto written = BatchLog::write_batch_log(test_dir, result);

  ASSERT_TRUE(written.has_value()) << written.error().message;
  EXPECT_EQ(*written, test_dir / BatchLog::log_file_name(BatchStart()));
  EXPECT_EQ(ReadFile(*written), BatchLog::format_entry(MovedEntry()));
}

TEST_F(BatchLogTest, AppendsToAnExistingLog) {
  CreateDummyFile(BatchLog::log_file_name(BatchStart()), "earlier\n");
  BatchResult result;
  result.started_at = BatchStart();
  result.entries = {SkippedEntry()};

  auto written = BatchLog::write_batch_log(test_dir, result);

  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(ReadFile(*written),
            "earlier\n" + BatchLog::format_entry(SkippedEntry()));
}

TEST_F(BatchLogTest, ReportsUnwritableDirectory) {
  BatchResult result;
  result.started_at = BatchStart();
  result.entries = {SkippedEntry()};

  auto written = BatchLog::write_batch_log(test_dir / "missing", result);

  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().kind, ErrorKind::LogWriteError);
  EXPECT_NE(written.error().message.find("Metadata_Log.txt"),
            std::string::npos);
}
