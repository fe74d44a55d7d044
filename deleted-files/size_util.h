// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DELETED_FILES_SIZE_UTIL_H_
#define DELETED_FILES_SIZE_UTIL_H_

#include <cstdint>
#include <string>
#include <string_view>

#include <base/types/expected.h>

namespace deleted_files {

enum class SizeParseError {
  // The text is not a number optionally followed by a unit letter and "B".
  kInvalidSizeFormat,
  // The text is well formed but the byte count does not fit in 64 bits.
  kOutOfRange,
};

std::string SizeParseErrorToString(SizeParseError error);

// Converts a human readable size such as "100M", "2.5T", "1kb" or "123" to a
// byte count. Units are binary (K = 1024, M = 1024^2, ... Y = 1024^8) and
// case-insensitive, a trailing "B" is optional and bare digits mean bytes.
// Fractional values are truncated to whole bytes without going through
// floating point, so ParseSize("2.5G") is exactly 2684354560.
base::expected<uint64_t, SizeParseError> ParseSize(std::string_view text);

// Formats |bytes| with one decimal digit and a binary unit, e.g. "0.0B",
// "1.5KB", "600.0GB". This is a display format and is not meant to round-trip
// through ParseSize().
std::string FormatSize(uint64_t bytes);

}  // namespace deleted_files

#endif  // DELETED_FILES_SIZE_UTIL_H_
