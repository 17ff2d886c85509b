#include "sequence_reset.h"

#include <glog/logging.h>

#include "../common/config.h"
#include "tag_format.h"

namespace TagLedger {

SequenceReset::SequenceReset(ILedgerStore& store) : store_(store) {}

LedgerError SequenceReset::Reset(const std::string& prefix, int64_t new_start_number, bool force,
		int padding, ResetResult& result) {
	if (!IsValidPrefix(prefix) || !IsValidPadding(padding) || new_start_number <= 0
			|| new_start_number > kMaxTagNumber) {
		LOG(WARNING) << "Reset rejected prefix '" << prefix << "' start " << new_start_number
			<< " padding " << padding;
		return ERR_VALIDATION_FAILURE;
	}

	bool would_collide = false;
	int64_t previous_max = 0;
	int64_t next = 0;
	StoreStatus status = store_.Write([&](LedgerTxn& txn) -> StoreStatus {
		StoreStatus s = txn.MaxTagNumber(prefix, previous_max);
		if (s != STORE_OK) return s;
		would_collide = new_start_number <= previous_max;
		if (would_collide && !force) {
			// Nothing written; commit of an empty transaction is harmless.
			return STORE_OK;
		}
		s = txn.SetNextTagNumber(prefix, new_start_number, store_.NowMs());
		if (s != STORE_OK) return s;
		return txn.NextTagNumber(prefix, next);
	});

	if (status != STORE_OK) {
		LOG(ERROR) << "Reset of prefix " << prefix << " failed: " << StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}
	result.previous_max = previous_max;
	if (would_collide && !force) {
		LOG(WARNING) << "Reset of prefix " << prefix << " to " << new_start_number
			<< " refused: numbers up to " << previous_max << " are already issued";
		return ERR_WOULD_CAUSE_COLLISION;
	}

	result.next_number = next;
	result.next_tag = FormatTag(prefix, next, padding);
	result.collision_risk = would_collide;
	if (would_collide) {
		LOG(WARNING) << "Forced reset of prefix " << prefix << " to " << new_start_number
			<< " below issued maximum " << previous_max << "; next tag is " << result.next_tag;
	} else {
		LOG(INFO) << "Reset prefix " << prefix << " to " << new_start_number
			<< "; next tag is " << result.next_tag;
	}
	return ERR_NO_ERROR;
}

} // namespace TagLedger
