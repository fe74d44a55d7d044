// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//
// list_deleted_open lists files that were deleted while a process still holds
// them open, largest first. Such files keep their disk space allocated until
// the last descriptor is closed.

#include <unistd.h>

#include <iostream>
#include <memory>

#include <base/command_line.h>
#include <base/logging.h>
#include <brillo/flag_helper.h>
#include <brillo/syslog_logging.h>

#include "deleted-files/deleted_files_tool.h"
#include "deleted-files/open_file_lister.h"
#include "deleted-files/process_executor.h"
#include "deleted-files/process_info.h"

namespace {

constexpr char kUsage[] =
    "List deleted-but-open files under a path, sorted by size.\n"
    "\n"
    "Usage: list_deleted_open [--minsize=SIZE] [--process] [PATH]\n"
    "\n"
    "PATH is a directory or mount point to scan (default: current directory).\n"
    "SIZE accepts bytes or a K/M/G/T/P/E/Z/Y suffix, e.g. 100M, 2.5T.";

}  // namespace

int main(int argc, char** argv) {
  DEFINE_string(minsize, deleted_files::kDefaultMinSize,
                "Minimum file size to report (e.g. 100M, 2T)");
  DEFINE_bool(process, false,
              "Show ps details for the process holding each file");
  DEFINE_string(lsof, deleted_files::kDefaultLsofProgram,
                "lsof binary used to enumerate open files");
  DEFINE_string(ps, deleted_files::kDefaultPsProgram,
                "ps binary used to describe processes");
  DEFINE_int32(log_level, 0,
               "Logging level - 0: LOG(INFO), -1: VLOG(1), -2: VLOG(2), ... "
               "Positive values are treated as 0.");
  brillo::FlagHelper::Init(argc, argv, kUsage);
  brillo::InitLog(brillo::kLogToStderr);
  deleted_files::SetVerbosityLevel(FLAGS_log_level);

  deleted_files::DeletedFilesTool::Options options;
  const auto status = deleted_files::ResolveScanPath(
      base::CommandLine::ForCurrentProcess()->GetArgs(), &options.path);
  if (status != deleted_files::kSuccess) {
    LOG(ERROR) << kUsage;
    return status;
  }

  deleted_files::WarnIfNotRoot(geteuid());

  options.min_size = FLAGS_minsize;
  options.show_process = FLAGS_process;
  options.lsof_program = FLAGS_lsof;
  options.ps_program = FLAGS_ps;

  const auto process_executor = deleted_files::ProcessExecutor::Create();
  deleted_files::DeletedFilesTool tool(process_executor.get(), &std::cout);
  return tool.Run(options);
}
