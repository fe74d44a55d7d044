// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/mock_process_executor.h"

namespace deleted_files {

MockProcessExecutor::MockProcessExecutor() = default;

MockProcessExecutor::~MockProcessExecutor() = default;

}  // namespace deleted_files
