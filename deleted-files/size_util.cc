// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "deleted-files/size_util.h"

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <base/numerics/checked_math.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>

namespace deleted_files {
namespace {

constexpr uint64_t kUnitBase = 1024;
constexpr int kBitsPerUnit = 10;

// Index + 1 is the power of 1024 the letter stands for.
constexpr std::string_view kUnitLetters = "KMGTPEZY";

constexpr const char* kUnitNames[] = {"", "K", "M", "G", "T",
                                      "P", "E", "Z", "Y"};

// Returns the length of the run of ASCII digits at the start of |text|.
size_t CountLeadingDigits(std::string_view text) {
  size_t count = 0;
  while (count < text.size() && base::IsAsciiDigit(text[count]))
    ++count;
  return count;
}

// Returns floor(0.|digits| * 2^|bits|), exactly, for any number of digits.
// The decimal fraction is doubled in place once per bit; the carry out of the
// first digit is the next bit of the result.
base::CheckedNumeric<uint64_t> ScaleFraction(std::string_view digits,
                                             int bits) {
  std::vector<uint8_t> fraction;
  fraction.reserve(digits.size());
  for (char digit : digits)
    fraction.push_back(static_cast<uint8_t>(digit - '0'));

  base::CheckedNumeric<uint64_t> scaled = 0;
  for (int bit = 0; bit < bits; ++bit) {
    uint8_t carry = 0;
    for (auto it = fraction.rbegin(); it != fraction.rend(); ++it) {
      const uint8_t doubled = *it * 2 + carry;
      *it = doubled % 10;
      carry = doubled / 10;
    }
    scaled = scaled * 2 + carry;
  }
  return scaled;
}

}  // namespace

std::string SizeParseErrorToString(SizeParseError error) {
  switch (error) {
    case SizeParseError::kInvalidSizeFormat:
      return "invalid size format";
    case SizeParseError::kOutOfRange:
      return "size out of range";
  }
  return "unknown size error";
}

base::expected<uint64_t, SizeParseError> ParseSize(std::string_view text) {
  const std::string_view size = base::TrimWhitespaceASCII(text, base::TRIM_ALL);

  size_t pos = CountLeadingDigits(size);
  const std::string_view whole_digits = size.substr(0, pos);
  std::string_view fraction_digits;
  if (pos < size.size() && size[pos] == '.') {
    ++pos;
    const size_t count = CountLeadingDigits(size.substr(pos));
    fraction_digits = size.substr(pos, count);
    pos += count;
  }
  if (whole_digits.empty() && fraction_digits.empty())
    return base::unexpected(SizeParseError::kInvalidSizeFormat);

  int power = 0;
  if (pos < size.size()) {
    const size_t unit = kUnitLetters.find(base::ToUpperASCII(size[pos]));
    if (unit != std::string_view::npos) {
      power = static_cast<int>(unit) + 1;
      ++pos;
    }
  }
  if (pos < size.size() && base::ToUpperASCII(size[pos]) == 'B')
    ++pos;
  if (pos != size.size())
    return base::unexpected(SizeParseError::kInvalidSizeFormat);

  uint64_t whole = 0;
  if (!whole_digits.empty() && !base::StringToUint64(whole_digits, &whole))
    return base::unexpected(SizeParseError::kOutOfRange);

  base::CheckedNumeric<uint64_t> bytes = whole;
  for (int i = 0; i < power; ++i)
    bytes *= kUnitBase;
  bytes += ScaleFraction(fraction_digits, power * kBitsPerUnit);

  uint64_t result = 0;
  if (!bytes.AssignIfValid(&result))
    return base::unexpected(SizeParseError::kOutOfRange);
  return result;
}

std::string FormatSize(uint64_t bytes) {
  // Values that would print as "1024.0" move up to the next unit.
  constexpr double kRoundingThreshold = kUnitBase - 0.05;

  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= kRoundingThreshold && unit + 1 < std::size(kUnitNames)) {
    value /= kUnitBase;
    ++unit;
  }
  return base::StringPrintf("%.1f%sB", value, kUnitNames[unit]);
}

}  // namespace deleted_files
