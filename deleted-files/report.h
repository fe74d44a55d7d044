// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_REPORT_H_
#define DELETED_FILES_REPORT_H_

#include <ostream>
#include <string>
#include <vector>

#include "deleted-files/deleted_file_record.h"
#include "deleted-files/process_info.h"

namespace deleted_files {

// Indentation of the process detail lines printed under a record.
inline constexpr char kDetailIndent[] = "    ";

// Sorts |records| by size, largest first. Records of equal size keep their
// relative order.
void SortBySizeDescending(std::vector<DeletedFileRecord>* records);

// Returns the tab-separated column header of the report.
std::string ReportHeader();

// Returns the tab-separated report row for |record|, with the size rendered by
// FormatSize().
std::string FormatRecordRow(const DeletedFileRecord& record);

// Writes the report table to a stream.
class ReportWriter {
 public:
  // When |process_info_fetcher| is not null, every row is followed by the ps
  // output for its PID, indented by kDetailIndent. Both pointers must outlive
  // this object.
  ReportWriter(std::ostream* out,
               const ProcessInfoFetcher* process_info_fetcher);

  ReportWriter(const ReportWriter&) = delete;
  ReportWriter& operator=(const ReportWriter&) = delete;

  // Writes the header and one row per record, in the order given.
  void WriteReport(const std::vector<DeletedFileRecord>& records);

 private:
  void WriteProcessDetails(const DeletedFileRecord& record);

  std::ostream* out_;
  const ProcessInfoFetcher* process_info_fetcher_;
};

}  // namespace deleted_files

#endif  // DELETED_FILES_REPORT_H_
