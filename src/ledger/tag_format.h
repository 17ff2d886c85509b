#pragma once

#include <cstdint>
#include <string>

namespace TagLedger {

/**
 * Tag strings are prefix + '-' + zero-padded number, e.g. "W12-0001".
 * Padding is a display width only: a number with more digits than the
 * width is written out in full, never truncated ("W12-12345" at width 4).
 */

// Non-empty, at most kMaxPrefixLength printable characters, no separator or whitespace.
bool IsValidPrefix(const std::string& prefix);

bool IsValidPadding(int padding);

// Caller must pass a valid prefix, padding and a positive number.
std::string FormatTag(const std::string& prefix, int64_t tag_number, int padding);

// Splits at the last separator. Returns false if the tag is not prefix-separator-digits.
bool ParseTag(const std::string& full_tag, std::string& prefix, int64_t& tag_number);

} // namespace TagLedger
