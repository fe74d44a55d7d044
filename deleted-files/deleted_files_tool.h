// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_DELETED_FILES_TOOL_H_
#define DELETED_FILES_DELETED_FILES_TOOL_H_

#include <sys/types.h>
#include <sysexits.h>

#include <cstdlib>
#include <ostream>
#include <string>
#include <vector>

#include <base/files/file_path.h>

#include "deleted-files/open_file_lister.h"
#include "deleted-files/process_executor.h"
#include "deleted-files/process_info.h"

namespace deleted_files {

inline constexpr char kDefaultMinSize[] = "500G";

enum ExitStatus {
  kSuccess = EXIT_SUCCESS,  // 0, also when nothing matched.
  kInvalidSize = 2,
  kUsage = EX_USAGE,
  kListerUnavailable = EX_UNAVAILABLE,
};

// Sets the minimum log level from --log_level. Negative values enable VLOG(n).
// Levels above LOG(INFO) are clamped, so warnings and the empty-result notice
// are always printed.
void SetVerbosityLevel(int log_level);

// Resolves the positional command-line arguments to the path to scan. No
// argument means the current directory. Returns kUsage, leaving |path|
// untouched, if there is more than one.
ExitStatus ResolveScanPath(const std::vector<std::string>& args,
                           base::FilePath* path);

// Logs a warning when |euid| is not root: lsof may then be unable to see files
// opened by other users. Never stops the run.
void WarnIfNotRoot(uid_t euid);

// Finds deleted-but-open files below a path and prints them, largest first.
class DeletedFilesTool {
 public:
  struct Options {
    // Directory or mount point to scan.
    base::FilePath path = base::FilePath(".");
    // Minimum size to report, in ParseSize() syntax.
    std::string min_size = kDefaultMinSize;
    // Print ps output for the owning process under every row.
    bool show_process = false;
    std::string lsof_program = kDefaultLsofProgram;
    std::string ps_program = kDefaultPsProgram;
  };

  // |process_executor| and |out| must outlive this object. Report data goes to
  // |out|; diagnostics go to the log.
  DeletedFilesTool(ProcessExecutor* process_executor, std::ostream* out);

  DeletedFilesTool(const DeletedFilesTool&) = delete;
  DeletedFilesTool& operator=(const DeletedFilesTool&) = delete;

  // Runs one scan and returns the process exit status.
  ExitStatus Run(const Options& options);

 private:
  ProcessExecutor* process_executor_;
  std::ostream* out_;
};

}  // namespace deleted_files

#endif  // DELETED_FILES_DELETED_FILES_TOOL_H_
