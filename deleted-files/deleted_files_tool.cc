// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/deleted_files_tool.h"

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <base/logging.h>
#include <base/numerics/clamped_math.h>

#include "deleted-files/deleted_file_record.h"
#include "deleted-files/open_file_lister.h"
#include "deleted-files/process_info.h"
#include "deleted-files/report.h"
#include "deleted-files/size_util.h"

namespace deleted_files {

void SetVerbosityLevel(int log_level) {
  logging::SetMinLogLevel(std::min(log_level, logging::LOGGING_INFO));
}

ExitStatus ResolveScanPath(const std::vector<std::string>& args,
                           base::FilePath* path) {
  if (args.size() > 1) {
    LOG(ERROR) << "Expected at most one path, got " << args.size() << ".";
    return kUsage;
  }
  *path = args.empty() ? base::FilePath(".") : base::FilePath(args[0]);
  return kSuccess;
}

void WarnIfNotRoot(uid_t euid) {
  if (euid != 0) {
    LOG(WARNING) << "Not running as root; lsof may not list all open files.";
  }
}

DeletedFilesTool::DeletedFilesTool(ProcessExecutor* process_executor,
                                   std::ostream* out)
    : process_executor_(process_executor), out_(out) {}

ExitStatus DeletedFilesTool::Run(const Options& options) {
  const auto min_size_bytes = ParseSize(options.min_size);
  if (!min_size_bytes.has_value()) {
    LOG(ERROR) << "Invalid --minsize '" << options.min_size
               << "': " << SizeParseErrorToString(min_size_bytes.error());
    return kInvalidSize;
  }

  const OpenFileLister lister(process_executor_, options.lsof_program);
  const auto listing = lister.ListOpenFiles(options.path);
  if (!listing.has_value()) {
    LOG(ERROR) << "Cannot enumerate open files: " << options.lsof_program
               << " could not be started";
    return kListerUnavailable;
  }

  std::vector<DeletedFileRecord> records =
      ParseLsofOutput(listing.value(), min_size_bytes.value());
  if (records.empty()) {
    LOG(INFO) << "No deleted-but-open files >= " << options.min_size
              << " found under '" << options.path.value() << "'.";
    return kSuccess;
  }

  SortBySizeDescending(&records);

  const ProcessInfoFetcher fetcher(process_executor_, options.ps_program);
  ReportWriter writer(out_, options.show_process ? &fetcher : nullptr);
  writer.WriteReport(records);

  base::ClampedNumeric<uint64_t> total_bytes = 0;
  for (const auto& record : records) {
    total_bytes += record.size_bytes();
  }
  LOG(INFO) << records.size() << " deleted-but-open file(s) holding "
            << FormatSize(static_cast<uint64_t>(total_bytes));
  return kSuccess;
}

}  // namespace deleted_files
