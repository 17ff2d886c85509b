#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "interfaces.h"

namespace TagLedger {

/**
 * Links a reserved tag to the identifier the external asset system gave it.
 *
 * Driven by an at-least-once webhook, so Confirm depends only on its
 * arguments and the ledger: a repeated delivery with the same identifier is
 * a successful no-op, a different identifier is a conflict and the stored one
 * is kept. Every delivery is journaled in the same transaction.
 */
class ConfirmationHandler {
	public:
		explicit ConfirmationHandler(ILedgerStore& store);

		// outcome, if given, receives what was journaled (also set on conflict/unknown).
		LedgerError Confirm(const std::string& full_tag, int64_t external_id,
				ConfirmationOutcome* outcome = nullptr);

		LedgerError History(const std::string& full_tag, std::vector<ConfirmationEvent>& events);

	private:
		ILedgerStore& store_;
};

} // namespace TagLedger
