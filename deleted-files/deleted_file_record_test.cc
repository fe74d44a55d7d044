// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/deleted_file_record.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace deleted_files {
namespace {

using ::testing::ElementsAre;

constexpr uint64_t kGiB = 1024ull * 1024 * 1024;

constexpr std::string_view kLsofHeader =
    "COMMAND     PID  USER   FD   TYPE DEVICE     SIZE/OFF NLINK     NODE NAME";

TEST(DeletedFileRecordTest, SplitLsofLineKeepsSpacesInName) {
  const auto fields = SplitLsofLine(
      "mysqld  1234 mysql  4w  REG  8,1  1024  0  1311 /var/tmp/my file "
      "(deleted)");
  ASSERT_TRUE(fields.has_value());
  EXPECT_THAT(*fields, ElementsAre("mysqld", "1234", "mysql", "4w", "REG",
                                   "8,1", "1024", "0", "1311",
                                   "/var/tmp/my file (deleted)"));
}

TEST(DeletedFileRecordTest, SplitLsofLineTrimsOuterWhitespace) {
  const auto fields =
      SplitLsofLine("  cat 1 root 3r REG 8,1 10 0 12 /tmp/x (deleted)  \r");
  ASSERT_TRUE(fields.has_value());
  EXPECT_EQ(fields->front(), "cat");
  EXPECT_EQ(fields->back(), "/tmp/x (deleted)");
}

TEST(DeletedFileRecordTest, SplitLsofLineRejectsShortRows) {
  EXPECT_FALSE(SplitLsofLine("").has_value());
  EXPECT_FALSE(SplitLsofLine("cat 1 root 3r REG 8,1 10 0 12").has_value());
  EXPECT_FALSE(SplitLsofLine("cat 1 root 3r REG 8,1 10 0 12   ").has_value());
}

TEST(DeletedFileRecordTest, CreateFromLsofLineSuccess) {
  const auto record = DeletedFileRecord::CreateFromLsofLine(
      "mysqld 1234 mysql 4w REG 8,1 644245094400 0 1311 /var/tmp/ibXyZ "
      "(deleted)",
      500 * kGiB);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->size_bytes(), 600 * kGiB);
  EXPECT_EQ(record->command(), "mysqld");
  EXPECT_EQ(record->pid(), "1234");
  EXPECT_EQ(record->user(), "mysql");
  EXPECT_EQ(record->file_descriptor(), "4w");
  EXPECT_EQ(record->file_type(), "REG");
  EXPECT_EQ(record->device(), "8,1");
  EXPECT_EQ(record->link_count(), 0);
  EXPECT_EQ(record->inode(), "1311");
  EXPECT_EQ(record->name(), "/var/tmp/ibXyZ (deleted)");
}

TEST(DeletedFileRecordTest, CreateFromLsofLineSizeAtThresholdIsKept) {
  EXPECT_TRUE(DeletedFileRecord::CreateFromLsofLine(
                  "java 7 app 9w REG 253,0 1024 0 55 /data/log (deleted)", 1024)
                  .has_value());
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9w REG 253,0 1023 0 55 /data/log (deleted)",
                   1024)
                   .has_value());
}

TEST(DeletedFileRecordTest, CreateFromLsofLineRequiresZeroLinks) {
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9w REG 253,0 4096 1 55 /data/log (deleted)", 0)
                   .has_value());
}

TEST(DeletedFileRecordTest, CreateFromLsofLineRequiresDeletedMarker) {
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9w REG 253,0 4096 0 55 /data/log", 0)
                   .has_value());
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9w REG 253,0 4096 0 55 /data/log deleted", 0)
                   .has_value());
}

TEST(DeletedFileRecordTest, CreateFromLsofLineRejectsNonNumericFields) {
  // lsof prints offsets such as "0t0" for non-regular files.
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9u unix 0xff 0t0 0 55 type=STREAM (deleted)", 0)
                   .has_value());
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9w REG 253,0 4096 x 55 /data/log (deleted)", 0)
                   .has_value());
  EXPECT_FALSE(DeletedFileRecord::CreateFromLsofLine(
                   "java 7 app 9w REG 253,0 -1 0 55 /data/log (deleted)", 0)
                   .has_value());
}

TEST(DeletedFileRecordTest, ParseLsofOutputFiltersRows) {
  const std::string output = std::string(kLsofHeader) +
                             "\n"
                             // Kept.
                             "a 1 root 1w REG 8,1 3000 0 11 /x/a (deleted)\n"
                             // Too small.
                             "b 2 root 1w REG 8,1 999 0 12 /x/b (deleted)\n"
                             // Still linked.
                             "c 3 root 1w REG 8,1 5000 1 13 /x/c (deleted)\n"
                             // No marker.
                             "d 4 root 1w REG 8,1 5000 0 14 /x/d\n"
                             // Malformed rows between good ones.
                             "e 5 root 1w REG\n"
                             "f 6 root 1w REG 8,1 big 0 16 /x/f (deleted)\n"
                             "\n"
                             // Kept, name with spaces.
                             "g 7 root 2w REG 8,1 1000 0 17 /x/g h (deleted)\n";

  const auto records = ParseLsofOutput(output, 1000);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].command(), "a");
  EXPECT_EQ(records[0].size_bytes(), 3000u);
  EXPECT_EQ(records[1].command(), "g");
  EXPECT_EQ(records[1].name(), "/x/g h (deleted)");
}

TEST(DeletedFileRecordTest, ParseLsofOutputSkipsHeaderOnly) {
  // The first line is always treated as the header, even if it looks like a
  // qualifying row.
  EXPECT_TRUE(ParseLsofOutput("", 0).empty());
  EXPECT_TRUE(ParseLsofOutput(kLsofHeader, 0).empty());
  EXPECT_TRUE(
      ParseLsofOutput("a 1 root 1w REG 8,1 3000 0 11 /x/a (deleted)\n", 0)
          .empty());
}

TEST(DeletedFileRecordTest, ParseLsofOutputKeepsListingOrder) {
  const std::string output = std::string(kLsofHeader) +
                             "\n"
                             "a 1 root 1w REG 8,1 10 0 11 /x/a (deleted)\n"
                             "b 2 root 1w REG 8,1 30 0 12 /x/b (deleted)\n"
                             "c 3 root 1w REG 8,1 20 0 13 /x/c (deleted)\n";
  std::vector<std::string> commands;
  for (const auto& record : ParseLsofOutput(output, 0)) {
    commands.push_back(record.command());
  }
  EXPECT_THAT(commands, ElementsAre("a", "b", "c"));
}

}  // namespace
}  // namespace deleted_files
