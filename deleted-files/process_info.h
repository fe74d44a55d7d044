// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_PROCESS_INFO_H_
#define DELETED_FILES_PROCESS_INFO_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "deleted-files/process_executor.h"

namespace deleted_files {

// Default program used to describe a process.
inline constexpr char kDefaultPsProgram[] = "ps";

// Looks up ownership, elapsed time and resource usage of a process with ps.
class ProcessInfoFetcher {
 public:
  // |process_executor| must outlive this object.
  ProcessInfoFetcher(ProcessExecutor* process_executor, std::string ps_program);

  ProcessInfoFetcher(const ProcessInfoFetcher&) = delete;
  ProcessInfoFetcher& operator=(const ProcessInfoFetcher&) = delete;

  // Runs `ps -o pid,ppid,user,etime,%cpu,%mem,cmd -p <pid>` and returns its
  // non-empty output lines, header included. Returns std::nullopt if ps could
  // not run, failed (usually because the process has exited) or printed no
  // data line.
  std::optional<std::vector<std::string>> GetProcessInfo(
      std::string_view pid) const;

 private:
  ProcessExecutor* process_executor_;
  const std::string ps_program_;
};

}  // namespace deleted_files

#endif  // DELETED_FILES_PROCESS_INFO_H_
