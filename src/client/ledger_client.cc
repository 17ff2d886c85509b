#include "ledger_client.h"

#include <utility>

#include <glog/logging.h>

#include "../ledger_service/ledger_service.h"

namespace TagLedger {

namespace {

TagRecord FromProtoRecord(const tagledger::TagRecord& in) {
	TagRecord record;
	record.prefix = in.prefix();
	record.tag_number = in.tag_number();
	record.full_tag = in.full_tag();
	record.external_id = in.external_id();
	record.reserved_at = in.reserved_at_ms();
	record.confirmed_at = in.confirmed_at_ms();
	record.is_confirmed = in.confirmed();
	return record;
}

ConfirmationOutcome FromProtoKind(tagledger::ConfirmationKind kind) {
	switch (kind) {
		case tagledger::CONFIRMATION_CONFIRMED:
			return ConfirmationOutcome::CONFIRMED;
		case tagledger::CONFIRMATION_DUPLICATE:
			return ConfirmationOutcome::DUPLICATE;
		case tagledger::CONFIRMATION_CONFLICT:
			return ConfirmationOutcome::CONFLICT;
		default:
			return ConfirmationOutcome::UNKNOWN_TAG;
	}
}

} // namespace

LedgerClient::LedgerClient(const std::string& server_address, std::chrono::milliseconds deadline)
	: LedgerClient(grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()), deadline) {}

LedgerClient::LedgerClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline)
	: stub_(tagledger::TagLedgerService::NewStub(channel)),
	deadline_(deadline) {}

void LedgerClient::PrepareContext(grpc::ClientContext& context) const {
	context.set_deadline(std::chrono::system_clock::now() + deadline_);
}

LedgerError LedgerClient::Finish(const char* rpc, const grpc::Status& status, tagledger::Outcome outcome,
		const std::string& message) {
	last_status_ = status;
	if (!status.ok()) {
		last_message_ = status.error_message();
		LOG(ERROR) << rpc << " failed: " << status.error_message();
		return ERR_STORE_FAILURE;
	}
	last_message_ = message;
	LedgerError err = FromProtoOutcome(outcome);
	if (err != ERR_NO_ERROR) {
		VLOG(1) << rpc << " returned " << LedgerErrorToString(err) << ": " << message;
	}
	return err;
}

LedgerError LedgerClient::PreviewNextTag(const std::string& prefix, PreviewResult& result) {
	tagledger::PreviewRequest request;
	request.set_prefix(prefix);

	tagledger::PreviewResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->PreviewNextTag(&context, request, &response);
	LedgerError err = Finish("PreviewNextTag", status, response.outcome(), response.message());
	if (err == ERR_NO_ERROR) {
		result.full_tag = response.next_tag();
		result.prefix = response.prefix();
		result.tag_number = response.sequence_number();
	}
	return err;
}

LedgerError LedgerClient::AllocateTag(const std::string& prefix, std::string& full_tag) {
	tagledger::AllocateRequest request;
	request.set_prefix(prefix);

	tagledger::AllocateResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->AllocateTag(&context, request, &response);
	LedgerError err = Finish("AllocateTag", status, response.outcome(), response.message());
	if (err == ERR_NO_ERROR) {
		full_tag = response.full_tag();
	}
	return err;
}

LedgerError LedgerClient::ConfirmTag(const std::string& full_tag, int64_t external_id,
		ConfirmationOutcome* outcome) {
	tagledger::ConfirmRequest request;
	request.set_full_tag(full_tag);
	request.set_external_id(external_id);

	tagledger::ConfirmResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->ConfirmTag(&context, request, &response);
	LedgerError err = Finish("ConfirmTag", status, response.outcome(), response.message());
	if (status.ok() && outcome != nullptr) {
		*outcome = FromProtoKind(response.kind());
	}
	return err;
}

LedgerError LedgerClient::ResetSequence(const std::string& prefix, int64_t new_start_number, bool force,
		ResetResult& result) {
	tagledger::ResetRequest request;
	request.set_prefix(prefix);
	request.set_new_start_number(new_start_number);
	request.set_force(force);

	tagledger::ResetResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->ResetSequence(&context, request, &response);
	LedgerError err = Finish("ResetSequence", status, response.outcome(), response.message());
	if (status.ok()) {
		result.next_tag = response.next_tag();
		result.next_number = response.next_number();
		result.previous_max = response.previous_max();
		result.collision_risk = response.collision_risk();
	}
	return err;
}

LedgerError LedgerClient::ListStaleReservations(const std::string& prefix, std::vector<TagRecord>& stale) {
	tagledger::StaleRequest request;
	request.set_prefix(prefix);
	return ListStale(request, stale);
}

LedgerError LedgerClient::ListStaleReservations(std::chrono::milliseconds age_threshold,
		const std::string& prefix, std::vector<TagRecord>& stale) {
	tagledger::StaleRequest request;
	request.set_age_threshold_ms(age_threshold.count());
	request.set_prefix(prefix);
	return ListStale(request, stale);
}

LedgerError LedgerClient::ListStale(const tagledger::StaleRequest& request, std::vector<TagRecord>& stale) {
	tagledger::StaleResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->ListStaleReservations(&context, request, &response);
	LedgerError err = Finish("ListStaleReservations", status, response.outcome(), response.message());
	stale.clear();
	if (err == ERR_NO_ERROR) {
		stale.reserve(response.records_size());
		for (const auto& record : response.records()) {
			stale.push_back(FromProtoRecord(record));
		}
	}
	return err;
}

LedgerError LedgerClient::LookupTag(const std::string& full_tag, TagRecord& record) {
	tagledger::LookupRequest request;
	request.set_full_tag(full_tag);

	tagledger::LookupResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->LookupTag(&context, request, &response);
	LedgerError err = Finish("LookupTag", status, response.outcome(), response.message());
	if (err == ERR_NO_ERROR) {
		record = FromProtoRecord(response.record());
	}
	return err;
}

LedgerError LedgerClient::ConfirmationHistory(const std::string& full_tag,
		std::vector<ConfirmationEvent>& events) {
	tagledger::HistoryRequest request;
	request.set_full_tag(full_tag);

	tagledger::HistoryResponse response;
	grpc::ClientContext context;
	PrepareContext(context);

	grpc::Status status = stub_->ConfirmationHistory(&context, request, &response);
	LedgerError err = Finish("ConfirmationHistory", status, response.outcome(), response.message());
	events.clear();
	if (err == ERR_NO_ERROR) {
		for (const auto& in : response.events()) {
			ConfirmationEvent event;
			event.event_id = in.event_id();
			event.full_tag = in.full_tag();
			event.external_id = in.external_id();
			event.received_at = in.received_at_ms();
			event.outcome = FromProtoKind(in.kind());
			events.push_back(event);
		}
	}
	return err;
}

} // namespace TagLedger
