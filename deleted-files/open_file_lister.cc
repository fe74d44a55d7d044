// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/open_file_lister.h"

#include <string>
#include <utility>

#include <base/logging.h>

namespace deleted_files {
namespace {

// Selects files whose link count is below one and adds the NLINK column.
constexpr char kLinkCountBelowOneArg[] = "+L1";

}  // namespace

OpenFileLister::OpenFileLister(ProcessExecutor* process_executor,
                               std::string lsof_program)
    : process_executor_(process_executor),
      lsof_program_(std::move(lsof_program)) {}

base::expected<std::string, OpenFileLister::Error>
OpenFileLister::ListOpenFiles(const base::FilePath& path) const {
  auto result = process_executor_->Run(lsof_program_,
                                       {kLinkCountBelowOneArg, path.value()});
  if (!result) {
    LOG(ERROR) << "Failed to run " << lsof_program_ << " on " << path;
    return base::unexpected(Error::kInvocationFailure);
  }

  if (result->exit_code != 0) {
    VLOG(1) << lsof_program_ << " exited with " << result->exit_code
            << ", stderr: " << result->stderr_output;
  }
  return std::move(result->stdout_output);
}

}  // namespace deleted_files
