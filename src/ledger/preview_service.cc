#include "preview_service.h"

#include <glog/logging.h>

#include "../common/config.h"
#include "tag_format.h"

namespace TagLedger {

PreviewService::PreviewService(ILedgerStore& store) : store_(store) {}

LedgerError PreviewService::Preview(const std::string& prefix, int padding, PreviewResult& result) {
	if (!IsValidPrefix(prefix) || !IsValidPadding(padding)) {
		LOG(WARNING) << "Preview rejected prefix '" << prefix << "' padding " << padding;
		return ERR_VALIDATION_FAILURE;
	}

	int64_t next = 0;
	StoreStatus status = store_.Read([&](LedgerTxn& txn) {
		return txn.NextTagNumber(prefix, next);
	});
	if (status != STORE_OK) {
		LOG(ERROR) << "Preview for prefix " << prefix << " failed: " << StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}
	if (next > kMaxTagNumber) {
		LOG(ERROR) << "Preview for prefix " << prefix << " failed: tag numbers exhausted";
		return ERR_STORE_FAILURE;
	}

	result.prefix = prefix;
	result.tag_number = next;
	result.full_tag = FormatTag(prefix, next, padding);
	return ERR_NO_ERROR;
}

} // namespace TagLedger
