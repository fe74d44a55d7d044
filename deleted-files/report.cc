// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/report.h"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>

#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>

#include "deleted-files/size_util.h"

namespace deleted_files {
namespace {

constexpr const char* kColumnNames[] = {
    "SIZE", "COMMAND", "PID",   "USER", "FD",
    "TYPE", "DEVICE",  "NLINK", "NODE", "NAME",
};

}  // namespace

void SortBySizeDescending(std::vector<DeletedFileRecord>* records) {
  std::stable_sort(records->begin(), records->end(),
                   [](const DeletedFileRecord& a, const DeletedFileRecord& b) {
                     return a.size_bytes() > b.size_bytes();
                   });
}

std::string ReportHeader() {
  return base::JoinString(
      std::vector<std::string>(std::begin(kColumnNames),
                               std::end(kColumnNames)),
      "\t");
}

std::string FormatRecordRow(const DeletedFileRecord& record) {
  const std::vector<std::string> columns = {
      FormatSize(record.size_bytes()),
      record.command(),
      record.pid(),
      record.user(),
      record.file_descriptor(),
      record.file_type(),
      record.device(),
      base::NumberToString(record.link_count()),
      record.inode(),
      record.name(),
  };
  return base::JoinString(columns, "\t");
}

ReportWriter::ReportWriter(std::ostream* out,
                           const ProcessInfoFetcher* process_info_fetcher)
    : out_(out), process_info_fetcher_(process_info_fetcher) {}

void ReportWriter::WriteReport(const std::vector<DeletedFileRecord>& records) {
  *out_ << ReportHeader() << "\n";
  for (const auto& record : records) {
    *out_ << FormatRecordRow(record) << "\n";
    if (process_info_fetcher_) {
      WriteProcessDetails(record);
    }
  }
  out_->flush();
}

void ReportWriter::WriteProcessDetails(const DeletedFileRecord& record) {
  const auto lines = process_info_fetcher_->GetProcessInfo(record.pid());
  if (!lines) {
    *out_ << kDetailIndent << "(no process info available for PID "
          << record.pid() << ")\n";
    return;
  }
  for (const auto& line : *lines) {
    *out_ << kDetailIndent << line << "\n";
  }
}

}  // namespace deleted_files
