#include "ledger_service.h"

#include <chrono>
#include <utility>
#include <vector>

#include <glog/logging.h>

namespace TagLedger {

namespace {

Status StoreUnavailable(const std::string& what) {
	return Status(grpc::StatusCode::UNAVAILABLE, what + ": ledger store failure");
}

} // namespace

tagledger::Outcome ToProtoOutcome(LedgerError error) {
	switch (error) {
		case ERR_NO_ERROR:
			return tagledger::OUTCOME_OK;
		case ERR_VALIDATION_FAILURE:
			return tagledger::OUTCOME_VALIDATION_FAILURE;
		case ERR_TRANSIENT_ALLOCATION_FAILURE:
			return tagledger::OUTCOME_TRANSIENT_ALLOCATION_FAILURE;
		case ERR_UNKNOWN_TAG:
			return tagledger::OUTCOME_UNKNOWN_TAG;
		case ERR_CONFIRMATION_CONFLICT:
			return tagledger::OUTCOME_CONFIRMATION_CONFLICT;
		case ERR_WOULD_CAUSE_COLLISION:
			return tagledger::OUTCOME_WOULD_CAUSE_COLLISION;
		case ERR_STORE_FAILURE:
			return tagledger::OUTCOME_STORE_FAILURE;
	}
	return tagledger::OUTCOME_STORE_FAILURE;
}

LedgerError FromProtoOutcome(tagledger::Outcome outcome) {
	switch (outcome) {
		case tagledger::OUTCOME_OK:
			return ERR_NO_ERROR;
		case tagledger::OUTCOME_VALIDATION_FAILURE:
			return ERR_VALIDATION_FAILURE;
		case tagledger::OUTCOME_TRANSIENT_ALLOCATION_FAILURE:
			return ERR_TRANSIENT_ALLOCATION_FAILURE;
		case tagledger::OUTCOME_UNKNOWN_TAG:
			return ERR_UNKNOWN_TAG;
		case tagledger::OUTCOME_CONFIRMATION_CONFLICT:
			return ERR_CONFIRMATION_CONFLICT;
		case tagledger::OUTCOME_WOULD_CAUSE_COLLISION:
			return ERR_WOULD_CAUSE_COLLISION;
		default:
			return ERR_STORE_FAILURE;
	}
}

tagledger::ConfirmationKind ToProtoKind(ConfirmationOutcome outcome) {
	switch (outcome) {
		case ConfirmationOutcome::CONFIRMED:
			return tagledger::CONFIRMATION_CONFIRMED;
		case ConfirmationOutcome::DUPLICATE:
			return tagledger::CONFIRMATION_DUPLICATE;
		case ConfirmationOutcome::CONFLICT:
			return tagledger::CONFIRMATION_CONFLICT;
		case ConfirmationOutcome::UNKNOWN_TAG:
			return tagledger::CONFIRMATION_UNKNOWN_TAG;
	}
	return tagledger::CONFIRMATION_UNKNOWN_TAG;
}

void ToProtoRecord(const TagRecord& record, tagledger::TagRecord* out) {
	out->set_prefix(record.prefix);
	out->set_tag_number(record.tag_number);
	out->set_full_tag(record.full_tag);
	out->set_external_id(record.external_id);
	out->set_reserved_at_ms(record.reserved_at);
	out->set_confirmed_at_ms(record.confirmed_at);
	out->set_confirmed(record.confirmed());
}

LedgerServiceImpl::LedgerServiceImpl(TagManager& manager, std::string default_prefix)
	: manager_(manager), default_prefix_(std::move(default_prefix)) {}

const std::string& LedgerServiceImpl::ResolvePrefix(const std::string& requested) const {
	return requested.empty() ? default_prefix_ : requested;
}

Status LedgerServiceImpl::PreviewNextTag(ServerContext* context, const tagledger::PreviewRequest* request,
		tagledger::PreviewResponse* reply) {
	PreviewResult result;
	LedgerError err = manager_.PreviewNextTag(ResolvePrefix(request->prefix()), result);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("PreviewNextTag");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_message(LedgerErrorToString(err));
	if (err == ERR_NO_ERROR) {
		reply->set_next_tag(result.full_tag);
		reply->set_prefix(result.prefix);
		reply->set_sequence_number(result.tag_number);
	}
	return Status::OK;
}

Status LedgerServiceImpl::AllocateTag(ServerContext* context, const tagledger::AllocateRequest* request,
		tagledger::AllocateResponse* reply) {
	std::string full_tag;
	LedgerError err = manager_.AllocateTag(ResolvePrefix(request->prefix()), full_tag);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("AllocateTag");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_message(LedgerErrorToString(err));
	if (err == ERR_NO_ERROR) {
		reply->set_full_tag(full_tag);
	}
	return Status::OK;
}

Status LedgerServiceImpl::ConfirmTag(ServerContext* context, const tagledger::ConfirmRequest* request,
		tagledger::ConfirmResponse* reply) {
	ConfirmationOutcome outcome = ConfirmationOutcome::UNKNOWN_TAG;
	LedgerError err = manager_.ConfirmTag(request->full_tag(), request->external_id(), &outcome);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("ConfirmTag");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_message(LedgerErrorToString(err));
	if (err != ERR_VALIDATION_FAILURE) {
		reply->set_kind(ToProtoKind(outcome));
	}
	return Status::OK;
}

Status LedgerServiceImpl::ResetSequence(ServerContext* context, const tagledger::ResetRequest* request,
		tagledger::ResetResponse* reply) {
	const std::string& prefix = ResolvePrefix(request->prefix());
	LOG(INFO) << "Reset requested for prefix " << prefix << " to " << request->new_start_number()
		<< (request->force() ? " (forced)" : "") << " from " << context->peer();
	ResetResult result;
	LedgerError err = manager_.ResetSequence(prefix, request->new_start_number(), request->force(), result);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("ResetSequence");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_previous_max(result.previous_max);
	if (err == ERR_NO_ERROR) {
		reply->set_next_tag(result.next_tag);
		reply->set_next_number(result.next_number);
		reply->set_collision_risk(result.collision_risk);
		reply->set_message(result.collision_risk
				? "Sequence reset; start overlaps issued numbers, which will be skipped"
				: "Sequence reset");
	} else {
		reply->set_message(LedgerErrorToString(err));
	}
	return Status::OK;
}

Status LedgerServiceImpl::ListStaleReservations(ServerContext* context, const tagledger::StaleRequest* request,
		tagledger::StaleResponse* reply) {
	std::chrono::milliseconds threshold = request->has_age_threshold_ms()
		? std::chrono::milliseconds(request->age_threshold_ms())
		: manager_.settings().stale_after;
	std::vector<TagRecord> stale;
	LedgerError err = manager_.ListStaleReservations(threshold, request->prefix(), stale);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("ListStaleReservations");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_message(LedgerErrorToString(err));
	for (const auto& record : stale) {
		ToProtoRecord(record, reply->add_records());
	}
	return Status::OK;
}

Status LedgerServiceImpl::LookupTag(ServerContext* context, const tagledger::LookupRequest* request,
		tagledger::LookupResponse* reply) {
	TagRecord record;
	LedgerError err = manager_.LookupTag(request->full_tag(), record);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("LookupTag");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_message(LedgerErrorToString(err));
	if (err == ERR_NO_ERROR) {
		ToProtoRecord(record, reply->mutable_record());
	}
	return Status::OK;
}

Status LedgerServiceImpl::ConfirmationHistory(ServerContext* context, const tagledger::HistoryRequest* request,
		tagledger::HistoryResponse* reply) {
	std::vector<ConfirmationEvent> events;
	LedgerError err = manager_.ConfirmationHistory(request->full_tag(), events);
	if (err == ERR_STORE_FAILURE) {
		return StoreUnavailable("ConfirmationHistory");
	}
	reply->set_outcome(ToProtoOutcome(err));
	reply->set_message(LedgerErrorToString(err));
	for (const auto& event : events) {
		tagledger::ConfirmationEvent* out = reply->add_events();
		out->set_event_id(event.event_id);
		out->set_full_tag(event.full_tag);
		out->set_external_id(event.external_id);
		out->set_received_at_ms(event.received_at);
		out->set_kind(ToProtoKind(event.outcome));
	}
	return Status::OK;
}

} // namespace TagLedger
