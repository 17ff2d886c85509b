#pragma once

#include <cstdint>
#include <string>

#include "interfaces.h"

namespace TagLedger {

struct ResetResult {
	// Tag the next Allocate for the prefix will produce.
	std::string next_tag;
	int64_t next_number = 0;
	// Highest number issued before the reset.
	int64_t previous_max = 0;
	// Set when force let the counter move to or below previous_max.
	bool collision_risk = false;
};

/**
 * Re-seeds where allocation resumes for a prefix. Existing rows are never
 * touched. Moving to a number that was already issued requires force; the
 * allocator still skips numbers that exist, so a forced reset reopens the
 * gaps below previous_max but never reissues a tag.
 */
class SequenceReset {
	public:
		explicit SequenceReset(ILedgerStore& store);

		LedgerError Reset(const std::string& prefix, int64_t new_start_number, bool force,
				int padding, ResetResult& result);

	private:
		ILedgerStore& store_;
};

} // namespace TagLedger
