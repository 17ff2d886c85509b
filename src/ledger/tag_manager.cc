#include "tag_manager.h"

#include <glog/logging.h>

namespace TagLedger {

TagManager::TagManager(ILedgerStore& store, const TagSettings& settings)
	: store_(store),
	settings_(settings),
	allocator_(store, settings.allocator),
	preview_(store),
	confirmation_(store),
	reset_(store),
	auditor_(store) {}

LedgerError TagManager::PreviewNextTag(const std::string& prefix, PreviewResult& result) {
	return preview_.Preview(prefix, settings_.padding, result);
}

LedgerError TagManager::AllocateTag(const std::string& prefix, std::string& full_tag) {
	LedgerError err = allocator_.Allocate(prefix, settings_.padding, full_tag);
	if (err == ERR_NO_ERROR) {
		LOG(INFO) << "Allocated asset tag " << full_tag;
	}
	return err;
}

LedgerError TagManager::ConfirmTag(const std::string& full_tag, int64_t external_id,
		ConfirmationOutcome* outcome) {
	return confirmation_.Confirm(full_tag, external_id, outcome);
}

LedgerError TagManager::ResetSequence(const std::string& prefix, int64_t new_start_number, bool force,
		ResetResult& result) {
	return reset_.Reset(prefix, new_start_number, force, settings_.padding, result);
}

LedgerError TagManager::ListStaleReservations(std::vector<TagRecord>& stale) {
	return auditor_.ListStale(settings_.stale_after, std::string(), stale);
}

LedgerError TagManager::ListStaleReservations(std::chrono::milliseconds age_threshold, const std::string& prefix,
		std::vector<TagRecord>& stale) {
	return auditor_.ListStale(age_threshold, prefix, stale);
}

LedgerError TagManager::LookupTag(const std::string& full_tag, TagRecord& record) {
	if (full_tag.empty()) {
		return ERR_VALIDATION_FAILURE;
	}
	StoreStatus status = store_.Read([&](LedgerTxn& txn) {
		return txn.FindByFullTag(full_tag, record);
	});
	if (status == STORE_NOT_FOUND) {
		return ERR_UNKNOWN_TAG;
	}
	if (status != STORE_OK) {
		LOG(ERROR) << "Lookup of " << full_tag << " failed: " << StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}
	return ERR_NO_ERROR;
}

LedgerError TagManager::ConfirmationHistory(const std::string& full_tag, std::vector<ConfirmationEvent>& events) {
	return confirmation_.History(full_tag, events);
}

} // namespace TagLedger
