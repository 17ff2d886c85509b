#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "confirmation_handler.h"
#include "interfaces.h"
#include "preview_service.h"
#include "sequence_allocator.h"
#include "sequence_reset.h"
#include "stale_auditor.h"

namespace TagLedger {

// Explicit settings for the ledger core; nothing is read from global configuration.
struct TagSettings {
	int padding = 4;
	std::chrono::milliseconds stale_after{std::chrono::hours(24)};
	AllocatorOptions allocator;
};

/**
 * Operational interface used by the RPC service and other collaborators.
 * Holds no ledger state of its own; every call goes to the store.
 */
class TagManager {
	public:
		TagManager(ILedgerStore& store, const TagSettings& settings);

		LedgerError PreviewNextTag(const std::string& prefix, PreviewResult& result);
		// Caller creates the external record after this returns.
		LedgerError AllocateTag(const std::string& prefix, std::string& full_tag);
		LedgerError ConfirmTag(const std::string& full_tag, int64_t external_id,
				ConfirmationOutcome* outcome = nullptr);
		LedgerError ResetSequence(const std::string& prefix, int64_t new_start_number, bool force,
				ResetResult& result);
		// Uses the configured threshold.
		LedgerError ListStaleReservations(std::vector<TagRecord>& stale);
		LedgerError ListStaleReservations(std::chrono::milliseconds age_threshold, const std::string& prefix,
				std::vector<TagRecord>& stale);
		LedgerError LookupTag(const std::string& full_tag, TagRecord& record);
		LedgerError ConfirmationHistory(const std::string& full_tag, std::vector<ConfirmationEvent>& events);

		const TagSettings& settings() const { return settings_; }

	private:
		ILedgerStore& store_;
		TagSettings settings_;
		SequenceAllocator allocator_;
		PreviewService preview_;
		ConfirmationHandler confirmation_;
		SequenceReset reset_;
		StaleReservationAuditor auditor_;
};

} // namespace TagLedger
