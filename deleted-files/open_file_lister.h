// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_OPEN_FILE_LISTER_H_
#define DELETED_FILES_OPEN_FILE_LISTER_H_

#include <string>

#include <base/files/file_path.h>
#include <base/types/expected.h>

#include "deleted-files/process_executor.h"

namespace deleted_files {

// Default program used to enumerate open files.
inline constexpr char kDefaultLsofProgram[] = "lsof";

// Collects the raw `lsof +L1 <path>` listing for a directory or mount point.
class OpenFileLister {
 public:
  enum class Error {
    // lsof could not be started at all.
    kInvocationFailure,
  };

  // |process_executor| must outlive this object.
  OpenFileLister(ProcessExecutor* process_executor, std::string lsof_program);

  OpenFileLister(const OpenFileLister&) = delete;
  OpenFileLister& operator=(const OpenFileLister&) = delete;

  // Returns whatever lsof printed on stdout, possibly nothing. lsof exits 1
  // both when nothing matched and on some real errors, so the exit code is
  // not treated as a failure; only a failure to spawn lsof is.
  base::expected<std::string, Error> ListOpenFiles(
      const base::FilePath& path) const;

  const std::string& lsof_program() const { return lsof_program_; }

 private:
  ProcessExecutor* process_executor_;
  const std::string lsof_program_;
};

}  // namespace deleted_files

#endif  // DELETED_FILES_OPEN_FILE_LISTER_H_
