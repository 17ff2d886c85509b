#ifndef TAGLEDGER_SRC_COMMON_CONFIG_H_
#define TAGLEDGER_SRC_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace TagLedger {

/// Tag format
/// Separates the prefix from the padded number ("W12-0001"). Never valid inside a prefix.
constexpr char kTagSeparator = '-';
/// Longest prefix accepted by validation.
constexpr size_t kMaxPrefixLength = 32;
/// Widest padding accepted; int64 tag numbers never need more digits.
constexpr int kMaxPaddingWidth = 19;
/// Largest tag number ever issued. The counter must always hold a successor.
constexpr int64_t kMaxTagNumber = INT64_MAX - 1;

/// Allocation retry configs
/// Attempts (constraint races + busy store) before reporting a transient failure.
constexpr int kDefaultAllocationAttempts = 8;
/// Base sleep between busy retries; doubled per attempt.
constexpr int64_t kDefaultRetryBackoffMs = 2;

/// Store configs
constexpr int kDefaultBusyTimeoutMs = 5000;

/// Service configs
constexpr int kDefaultServicePort = 50061;
constexpr int64_t kDefaultClientDeadlineMs = 3000;

} // namespace TagLedger

#endif // TAGLEDGER_SRC_COMMON_CONFIG_H_
