// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_MOCK_PROCESS_EXECUTOR_H_
#define DELETED_FILES_MOCK_PROCESS_EXECUTOR_H_

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

#include "deleted-files/process_executor.h"

namespace deleted_files {
class MockProcessExecutor : public ProcessExecutor {
 public:
  MockProcessExecutor();
  MockProcessExecutor(const MockProcessExecutor&) = delete;
  MockProcessExecutor& operator=(const MockProcessExecutor&) = delete;

  ~MockProcessExecutor();

  MOCK_METHOD(std::optional<ProcessResult>,
              Run,
              (const std::string& program,
               const std::vector<std::string>& args),
              (override));
};

}  // namespace deleted_files

#endif  // DELETED_FILES_MOCK_PROCESS_EXECUTOR_H_
