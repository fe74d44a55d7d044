// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/process_info.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <base/logging.h>
#include <base/strings/string_split.h>
#include <base/strings/string_util.h>

namespace deleted_files {
namespace {

constexpr char kPsFormat[] = "pid,ppid,user,etime,%cpu,%mem,cmd";

}  // namespace

ProcessInfoFetcher::ProcessInfoFetcher(ProcessExecutor* process_executor,
                                       std::string ps_program)
    : process_executor_(process_executor), ps_program_(std::move(ps_program)) {}

std::optional<std::vector<std::string>> ProcessInfoFetcher::GetProcessInfo(
    std::string_view pid) const {
  const auto result = process_executor_->Run(
      ps_program_, {"-o", kPsFormat, "-p", std::string(pid)});
  if (!result) {
    return std::nullopt;
  }
  if (result->exit_code != 0) {
    VLOG(1) << "No process info for PID " << pid << ": " << ps_program_
            << " exited with " << result->exit_code;
    return std::nullopt;
  }

  // Leading spaces are kept so the header stays aligned with the data line.
  std::vector<std::string> lines;
  for (const auto& line :
       base::SplitStringPiece(result->stdout_output, "\n",
                              base::KEEP_WHITESPACE, base::SPLIT_WANT_ALL)) {
    const auto trimmed = base::TrimWhitespaceASCII(line, base::TRIM_TRAILING);
    if (!trimmed.empty())
      lines.emplace_back(trimmed);
  }
  // A header alone means ps found nothing to describe.
  if (lines.size() < 2) {
    VLOG(1) << "No process info for PID " << pid << ": empty ps output";
    return std::nullopt;
  }
  return lines;
}

}  // namespace deleted_files
