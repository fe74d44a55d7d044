// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/process_executor.h"

#include <unistd.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <base/logging.h>
#include <base/strings/strcat.h>
#include <base/strings/string_util.h>
#include <brillo/process/process.h>

namespace deleted_files {
namespace {

class ProcessExecutorImpl : public ProcessExecutor {
 public:
  ProcessExecutorImpl() = default;
  ~ProcessExecutorImpl() override = default;

  std::optional<ProcessResult> Run(
      const std::string& program,
      const std::vector<std::string>& args) override;
};

std::optional<ProcessResult> ProcessExecutorImpl::Run(
    const std::string& program, const std::vector<std::string>& args) {
  brillo::ProcessImpl process;

  process.AddArg(program);
  for (const auto& arg : args) {
    process.AddArg(arg);
  }
  process.SetSearchPath(true);

  // Redirect stdout and stderr to memory.
  process.RedirectOutputToMemory(/*combine=*/false);

  const int process_ret = process.Run();

  const std::string logging_tag =
      base::StrCat({"`", program, " ", base::JoinString(args, " "), "`"});

  // Run() returns -1 when fork or pipe setup fails, and the child exits with
  // kErrorExitStatus when exec fails.
  if (process_ret < 0 || process_ret == brillo::Process::kErrorExitStatus) {
    LOG(ERROR) << "Failed to execute " << logging_tag
               << ", Process::Run() returned " << process_ret;
    return std::nullopt;
  }

  ProcessResult result;
  result.exit_code = process_ret;
  result.stdout_output = process.GetOutputString(STDOUT_FILENO);
  result.stderr_output = process.GetOutputString(STDERR_FILENO);
  VLOG(1) << logging_tag << " exited with " << process_ret;
  return std::move(result);
}

}  // namespace

std::unique_ptr<ProcessExecutor> ProcessExecutor::Create() {
  return std::make_unique<ProcessExecutorImpl>();
}

}  // namespace deleted_files
