#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "interfaces.h"

namespace TagLedger {

/**
 * Lists reservations that were never confirmed within a window, for operator
 * follow-up. Read-only: a stale number stays consumed because the external
 * record may still be created late.
 */
class StaleReservationAuditor {
	public:
		explicit StaleReservationAuditor(ILedgerStore& store);

		// Empty prefix audits every prefix. Results are ordered by prefix, then number.
		LedgerError ListStale(std::chrono::milliseconds older_than, const std::string& prefix,
				std::vector<TagRecord>& stale);

	private:
		ILedgerStore& store_;
};

} // namespace TagLedger
