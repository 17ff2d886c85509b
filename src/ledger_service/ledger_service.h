#ifndef TAGLEDGER_SRC_LEDGER_SERVICE_LEDGER_SERVICE_H_
#define TAGLEDGER_SRC_LEDGER_SERVICE_LEDGER_SERVICE_H_

#include <string>

#include <grpcpp/grpcpp.h>
#include <tag_ledger.grpc.pb.h>

#include "../ledger/tag_manager.h"

namespace TagLedger {

using grpc::ServerContext;
using grpc::Status;

tagledger::Outcome ToProtoOutcome(LedgerError error);
LedgerError FromProtoOutcome(tagledger::Outcome outcome);
tagledger::ConfirmationKind ToProtoKind(ConfirmationOutcome outcome);
void ToProtoRecord(const TagRecord& record, tagledger::TagRecord* out);

/**
 * gRPC front of TagManager. Domain outcomes travel in the reply's outcome
 * field with Status::OK; only a failing store turns into a gRPC error, so
 * webhook relays can tell "retry later" from "reconcile by hand".
 */
class LedgerServiceImpl final : public tagledger::TagLedgerService::Service {
	public:
		LedgerServiceImpl(TagManager& manager, std::string default_prefix);

		Status PreviewNextTag(ServerContext* context, const tagledger::PreviewRequest* request,
				tagledger::PreviewResponse* reply) override;
		Status AllocateTag(ServerContext* context, const tagledger::AllocateRequest* request,
				tagledger::AllocateResponse* reply) override;
		Status ConfirmTag(ServerContext* context, const tagledger::ConfirmRequest* request,
				tagledger::ConfirmResponse* reply) override;
		Status ResetSequence(ServerContext* context, const tagledger::ResetRequest* request,
				tagledger::ResetResponse* reply) override;
		Status ListStaleReservations(ServerContext* context, const tagledger::StaleRequest* request,
				tagledger::StaleResponse* reply) override;
		Status LookupTag(ServerContext* context, const tagledger::LookupRequest* request,
				tagledger::LookupResponse* reply) override;
		Status ConfirmationHistory(ServerContext* context, const tagledger::HistoryRequest* request,
				tagledger::HistoryResponse* reply) override;

	private:
		const std::string& ResolvePrefix(const std::string& requested) const;

		TagManager& manager_;
		std::string default_prefix_;
};

} // namespace TagLedger

#endif // TAGLEDGER_SRC_LEDGER_SERVICE_LEDGER_SERVICE_H_
