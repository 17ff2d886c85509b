#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <tag_ledger.grpc.pb.h>

#include "../common/config.h"
#include "../ledger/ledger_error.h"
#include "../ledger/preview_service.h"
#include "../ledger/sequence_reset.h"
#include "../ledger/tag_record.h"

namespace TagLedger {

/*
	// Create client
	LedgerClient client("127.0.0.1:" + std::to_string(kDefaultServicePort));
	std::string tag;
	if (client.AllocateTag("", tag) == ERR_NO_ERROR) { ... create the asset with tag ... }
	client.ConfirmTag(tag, asset_id);

	An empty prefix asks the server for its default prefix. A call that
	never reached the server (deadline, connection refused) or that the server
	reported as a store failure returns ERR_STORE_FAILURE; last_status() has
	the gRPC detail.
*/
class LedgerClient {
	public:
		LedgerClient(const std::string& server_address,
				std::chrono::milliseconds deadline = std::chrono::milliseconds(kDefaultClientDeadlineMs));
		LedgerClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline);

		LedgerError PreviewNextTag(const std::string& prefix, PreviewResult& result);
		LedgerError AllocateTag(const std::string& prefix, std::string& full_tag);
		LedgerError ConfirmTag(const std::string& full_tag, int64_t external_id,
				ConfirmationOutcome* outcome = nullptr);
		LedgerError ResetSequence(const std::string& prefix, int64_t new_start_number, bool force,
				ResetResult& result);
		// Uses the server's configured threshold.
		LedgerError ListStaleReservations(const std::string& prefix, std::vector<TagRecord>& stale);
		// A zero threshold lists every unconfirmed reservation.
		LedgerError ListStaleReservations(std::chrono::milliseconds age_threshold, const std::string& prefix,
				std::vector<TagRecord>& stale);
		LedgerError LookupTag(const std::string& full_tag, TagRecord& record);
		LedgerError ConfirmationHistory(const std::string& full_tag, std::vector<ConfirmationEvent>& events);

		const grpc::Status& last_status() const { return last_status_; }
		const std::string& last_message() const { return last_message_; }

	private:
		void PrepareContext(grpc::ClientContext& context) const;
		LedgerError ListStale(const tagledger::StaleRequest& request, std::vector<TagRecord>& stale);
		LedgerError Finish(const char* rpc, const grpc::Status& status, tagledger::Outcome outcome,
				const std::string& message);

		std::unique_ptr<tagledger::TagLedgerService::Stub> stub_;
		std::chrono::milliseconds deadline_;
		grpc::Status last_status_;
		std::string last_message_;
};

} // namespace TagLedger
