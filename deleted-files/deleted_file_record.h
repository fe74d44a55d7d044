// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_DELETED_FILE_RECORD_H_
#define DELETED_FILES_DELETED_FILE_RECORD_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deleted_files {

// Marker lsof appends to the NAME column of an unlinked file.
inline constexpr std::string_view kDeletedMarker = "(deleted)";

// Number of columns in a row of `lsof +L1` output: COMMAND, PID, USER, FD,
// TYPE, DEVICE, SIZE/OFF, NLINK, NODE and NAME.
inline constexpr size_t kLsofFieldCount = 10;

// Splits a row of lsof output into kLsofFieldCount fields separated by
// whitespace. The last field (NAME) keeps the whitespace it contains, since
// paths may have spaces. Returns std::nullopt if the row has fewer fields.
std::optional<std::vector<std::string_view>> SplitLsofLine(
    std::string_view line);

// An open file descriptor that refers to an unlinked file of at least a given
// size. Instances only exist for rows that passed that check.
class DeletedFileRecord {
 public:
  // Creates a record from one row of `lsof +L1` output, for example
  // "mysqld 1234 mysql 4w REG 8,1 644245094400 0 1311 /var/tmp/ib (deleted)".
  // Returns std::nullopt if the row is malformed (wrong number of fields,
  // non-integer SIZE/OFF or NLINK), if the link count is not 0, if NAME lacks
  // the "(deleted)" marker, or if the size is below |min_size_bytes|.
  static std::optional<DeletedFileRecord> CreateFromLsofLine(
      std::string_view line, uint64_t min_size_bytes);

  // DeletedFileRecord is copyable.
  DeletedFileRecord(const DeletedFileRecord& other);
  DeletedFileRecord& operator=(const DeletedFileRecord& other);

  uint64_t size_bytes() const { return size_bytes_; }
  const std::string& command() const { return command_; }
  const std::string& pid() const { return pid_; }
  const std::string& user() const { return user_; }
  const std::string& file_descriptor() const { return file_descriptor_; }
  const std::string& file_type() const { return file_type_; }
  const std::string& device() const { return device_; }
  int link_count() const { return link_count_; }
  const std::string& inode() const { return inode_; }
  const std::string& name() const { return name_; }

  bool operator==(const DeletedFileRecord& rhs) const;

 private:
  DeletedFileRecord();

  uint64_t size_bytes_ = 0;
  std::string command_;
  std::string pid_;
  std::string user_;
  std::string file_descriptor_;
  std::string file_type_;
  std::string device_;
  int link_count_ = 0;
  std::string inode_;
  std::string name_;
};

// Parses the full output of `lsof +L1`. The first line is the column header
// and is skipped. Returns the rows that qualify as DeletedFileRecord, in
// listing order; every other row is dropped without stopping the parse.
std::vector<DeletedFileRecord> ParseLsofOutput(std::string_view output,
                                               uint64_t min_size_bytes);

}  // namespace deleted_files

#endif  // DELETED_FILES_DELETED_FILE_RECORD_H_
