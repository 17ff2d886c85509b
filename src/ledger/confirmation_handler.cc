#include "confirmation_handler.h"

#include <utility>

#include <glog/logging.h>

namespace TagLedger {

ConfirmationHandler::ConfirmationHandler(ILedgerStore& store) : store_(store) {}

LedgerError ConfirmationHandler::Confirm(const std::string& full_tag, int64_t external_id,
		ConfirmationOutcome* outcome) {
	if (full_tag.empty()) {
		LOG(WARNING) << "Confirm rejected tag '" << full_tag << "' external id " << external_id;
		return ERR_VALIDATION_FAILURE;
	}

	ConfirmationOutcome result = ConfirmationOutcome::CONFIRMED;
	int64_t existing_id = 0;
	StoreStatus status = store_.Write([&](LedgerTxn& txn) -> StoreStatus {
		TimestampMs now = store_.NowMs();
		TagRecord record;
		StoreStatus s = txn.FindByFullTag(full_tag, record);
		if (s == STORE_NOT_FOUND) {
			result = ConfirmationOutcome::UNKNOWN_TAG;
		} else if (s != STORE_OK) {
			return s;
		} else if (!record.confirmed()) {
			s = txn.MarkConfirmed(full_tag, external_id, now);
			if (s != STORE_OK) return s;
			result = ConfirmationOutcome::CONFIRMED;
		} else if (record.external_id == external_id) {
			result = ConfirmationOutcome::DUPLICATE;
		} else {
			existing_id = record.external_id;
			result = ConfirmationOutcome::CONFLICT;
		}

		ConfirmationEvent event;
		event.full_tag = full_tag;
		event.external_id = external_id;
		event.received_at = now;
		event.outcome = result;
		return txn.AppendConfirmationEvent(event);
	});

	if (status != STORE_OK) {
		LOG(ERROR) << "Confirm " << full_tag << " -> " << external_id << " failed: "
			<< StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}
	if (outcome != nullptr) {
		*outcome = result;
	}

	switch (result) {
		case ConfirmationOutcome::CONFIRMED:
			LOG(INFO) << "Confirmed " << full_tag << " as external asset " << external_id;
			return ERR_NO_ERROR;
		case ConfirmationOutcome::DUPLICATE:
			VLOG(1) << "Duplicate confirmation of " << full_tag << " as " << external_id;
			return ERR_NO_ERROR;
		case ConfirmationOutcome::CONFLICT:
			LOG(WARNING) << "Confirmation conflict for " << full_tag << ": ledger has external asset "
				<< existing_id << ", delivery claims " << external_id;
			return ERR_CONFIRMATION_CONFLICT;
		case ConfirmationOutcome::UNKNOWN_TAG:
			LOG(WARNING) << "Confirmation for unknown tag " << full_tag << " (external asset "
				<< external_id << ")";
			return ERR_UNKNOWN_TAG;
	}
	return ERR_STORE_FAILURE;
}

LedgerError ConfirmationHandler::History(const std::string& full_tag, std::vector<ConfirmationEvent>& events) {
	if (full_tag.empty()) {
		return ERR_VALIDATION_FAILURE;
	}
	std::vector<ConfirmationEvent> found;
	StoreStatus status = store_.Read([&](LedgerTxn& txn) {
		return txn.ListConfirmationEvents(full_tag, found);
	});
	if (status != STORE_OK) {
		LOG(ERROR) << "Reading confirmation history of " << full_tag << " failed: "
			<< StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}
	events = std::move(found);
	return ERR_NO_ERROR;
}

} // namespace TagLedger
