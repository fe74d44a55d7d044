// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_PROCESS_EXECUTOR_H_
#define DELETED_FILES_PROCESS_EXECUTOR_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace deleted_files {

// What an external program left behind once it exited.
struct ProcessResult {
  int exit_code = 0;
  std::string stdout_output;
  std::string stderr_output;
};

// Runs external programs. This is the only place where lsof and ps are
// spawned, so everything above it can be tested against captured output.
class ProcessExecutor {
 public:
  static std::unique_ptr<ProcessExecutor> Create();

  virtual ~ProcessExecutor() = default;

  // ProcessExecutor is neither copyable nor movable.
  ProcessExecutor(const ProcessExecutor&) = delete;
  ProcessExecutor& operator=(const ProcessExecutor&) = delete;

  // Executes |program| with |args| and blocks until it exits. |program| is
  // looked up in PATH when it has no slash.
  // - If the program ran, returns its exit code and captured output, whether
  //   or not the exit code is 0.
  // - If the program could not be started at all, returns std::nullopt.
  //   brillo::Process reports a failed exec as exit code 127
  //   (brillo::Process::kErrorExitStatus), so a program that itself exits
  //   with 127 is also reported as std::nullopt.
  virtual std::optional<ProcessResult> Run(
      const std::string& program, const std::vector<std::string>& args) = 0;

 protected:
  ProcessExecutor() = default;
};

}  // namespace deleted_files

#endif  // DELETED_FILES_PROCESS_EXECUTOR_H_
