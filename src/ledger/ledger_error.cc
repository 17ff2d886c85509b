#include "ledger_error.h"

namespace TagLedger {

const char* LedgerErrorToString(LedgerError error) {
	switch (error) {
		case ERR_NO_ERROR:
			return "OK";
		case ERR_VALIDATION_FAILURE:
			return "ValidationFailure";
		case ERR_TRANSIENT_ALLOCATION_FAILURE:
			return "TransientAllocationFailure";
		case ERR_UNKNOWN_TAG:
			return "UnknownTag";
		case ERR_CONFIRMATION_CONFLICT:
			return "ConfirmationConflict";
		case ERR_WOULD_CAUSE_COLLISION:
			return "WouldCauseCollision";
		case ERR_STORE_FAILURE:
			return "StoreFailure";
	}
	return "Unknown";
}

const char* StoreStatusToString(StoreStatus status) {
	switch (status) {
		case STORE_OK:
			return "ok";
		case STORE_NOT_FOUND:
			return "not found";
		case STORE_CONSTRAINT:
			return "constraint violation";
		case STORE_BUSY:
			return "busy";
		case STORE_ERROR:
			return "error";
	}
	return "unknown";
}

} // namespace TagLedger
