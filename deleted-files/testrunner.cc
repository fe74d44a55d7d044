// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <gtest/gtest.h>

#include <base/at_exit.h>
#include <brillo/syslog_logging.h>

int main(int argc, char** argv) {
  base::AtExitManager at_exit_manager;
  // Initialize logging so tests are able to check logs with
  // brillo::LogToString(true) and brillo::GetLog().
  brillo::InitLog(brillo::kLogToStderr);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
