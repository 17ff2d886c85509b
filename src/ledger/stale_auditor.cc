#include "stale_auditor.h"

#include <utility>

#include <glog/logging.h>

#include "tag_format.h"

namespace TagLedger {

StaleReservationAuditor::StaleReservationAuditor(ILedgerStore& store) : store_(store) {}

LedgerError StaleReservationAuditor::ListStale(std::chrono::milliseconds older_than, const std::string& prefix,
		std::vector<TagRecord>& stale) {
	if (older_than.count() < 0 || (!prefix.empty() && !IsValidPrefix(prefix))) {
		LOG(WARNING) << "Stale audit rejected threshold " << older_than.count() << "ms prefix '" << prefix << "'";
		return ERR_VALIDATION_FAILURE;
	}

	TimestampMs cutoff = store_.NowMs() - older_than.count();
	std::vector<TagRecord> found;
	StoreStatus status = store_.Read([&](LedgerTxn& txn) {
		return txn.ListUnconfirmedBefore(cutoff, prefix, found);
	});
	if (status != STORE_OK) {
		LOG(ERROR) << "Stale audit failed: " << StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}
	VLOG(1) << "Stale audit found " << found.size() << " reservation(s) older than "
		<< older_than.count() << "ms";
	stale = std::move(found);
	return ERR_NO_ERROR;
}

} // namespace TagLedger
