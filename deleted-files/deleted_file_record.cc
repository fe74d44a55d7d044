// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/deleted_file_record.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_split.h>
#include <base/strings/string_util.h>

namespace deleted_files {
namespace {

// Column positions in a row of `lsof +L1` output.
enum LsofField : size_t {
  kCommand = 0,
  kPid,
  kUser,
  kFd,
  kType,
  kDevice,
  kSize,
  kLinkCount,
  kNode,
  kName,
};

size_t SkipWhitespace(std::string_view text, size_t pos) {
  while (pos < text.size() && base::IsAsciiWhitespace(text[pos]))
    ++pos;
  return pos;
}

}  // namespace

std::optional<std::vector<std::string_view>> SplitLsofLine(
    std::string_view line) {
  std::vector<std::string_view> fields;
  fields.reserve(kLsofFieldCount);

  size_t pos = SkipWhitespace(line, 0);
  while (fields.size() + 1 < kLsofFieldCount && pos < line.size()) {
    size_t end = pos;
    while (end < line.size() && !base::IsAsciiWhitespace(line[end]))
      ++end;
    fields.push_back(line.substr(pos, end - pos));
    pos = SkipWhitespace(line, end);
  }

  const std::string_view name =
      base::TrimWhitespaceASCII(line.substr(pos), base::TRIM_TRAILING);
  if (fields.size() + 1 != kLsofFieldCount || name.empty())
    return std::nullopt;
  fields.push_back(name);
  return fields;
}

// static
std::optional<DeletedFileRecord> DeletedFileRecord::CreateFromLsofLine(
    std::string_view line, uint64_t min_size_bytes) {
  const auto fields = SplitLsofLine(line);
  if (!fields) {
    VLOG(2) << "Skipping row with fewer than " << kLsofFieldCount
            << " fields: " << line;
    return std::nullopt;
  }

  uint64_t size_bytes = 0;
  int link_count = 0;
  if (!base::StringToUint64((*fields)[kSize], &size_bytes) ||
      !base::StringToInt((*fields)[kLinkCount], &link_count)) {
    VLOG(2) << "Skipping row with non-numeric SIZE/OFF or NLINK: " << line;
    return std::nullopt;
  }

  // Both conditions are required: lsof must see no remaining links and must
  // itself have flagged the name as deleted.
  if (link_count != 0 ||
      (*fields)[kName].find(kDeletedMarker) == std::string_view::npos) {
    return std::nullopt;
  }
  if (size_bytes < min_size_bytes)
    return std::nullopt;

  DeletedFileRecord record;
  record.size_bytes_ = size_bytes;
  record.command_ = std::string((*fields)[kCommand]);
  record.pid_ = std::string((*fields)[kPid]);
  record.user_ = std::string((*fields)[kUser]);
  record.file_descriptor_ = std::string((*fields)[kFd]);
  record.file_type_ = std::string((*fields)[kType]);
  record.device_ = std::string((*fields)[kDevice]);
  record.link_count_ = link_count;
  record.inode_ = std::string((*fields)[kNode]);
  record.name_ = std::string((*fields)[kName]);
  return record;
}

DeletedFileRecord::DeletedFileRecord(const DeletedFileRecord& other) = default;
DeletedFileRecord& DeletedFileRecord::operator=(
    const DeletedFileRecord& other) = default;

bool DeletedFileRecord::operator==(const DeletedFileRecord& rhs) const =
    default;

DeletedFileRecord::DeletedFileRecord() = default;

std::vector<DeletedFileRecord> ParseLsofOutput(std::string_view output,
                                               uint64_t min_size_bytes) {
  std::vector<DeletedFileRecord> records;
  const auto lines = base::SplitStringPiece(
      output, "\n", base::KEEP_WHITESPACE, base::SPLIT_WANT_NONEMPTY);
  if (lines.size() < 2)
    return records;

  // lines[0] is the "COMMAND PID USER ..." header.
  for (size_t i = 1; i < lines.size(); ++i) {
    auto record = DeletedFileRecord::CreateFromLsofLine(lines[i],
                                                        min_size_bytes);
    if (record)
      records.push_back(std::move(*record));
  }
  return records;
}

}  // namespace deleted_files
