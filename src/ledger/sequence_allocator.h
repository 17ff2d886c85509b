#pragma once

#include <cstdint>
#include <string>

#include "../common/config.h"
#include "interfaces.h"

namespace TagLedger {

struct AllocatorOptions {
	// Total attempts across uniqueness races and busy-store retries.
	int max_attempts = kDefaultAllocationAttempts;
	// Sleep before retrying a busy store; doubled per busy attempt.
	int64_t retry_backoff_ms = kDefaultRetryBackoffMs;
};

/**
 * Reserves the next tag number for a prefix.
 *
 * Each attempt is one write transaction: read the effective next number,
 * insert the row, advance the prefix counter. A uniqueness violation moves on
 * to the next candidate inside the same transaction; a busy store backs off
 * and starts a new transaction. No counter is cached between calls.
 */
class SequenceAllocator {
	public:
		SequenceAllocator(ILedgerStore& store, const AllocatorOptions& options = AllocatorOptions());

		// On success full_tag holds the new tag and tag_number (if given) its number.
		LedgerError Allocate(const std::string& prefix, int padding, std::string& full_tag,
				int64_t* tag_number = nullptr);

	private:
		ILedgerStore& store_;
		AllocatorOptions options_;
};

} // namespace TagLedger
