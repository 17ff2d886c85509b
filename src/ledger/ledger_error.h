#pragma once

#include <cstdint>

namespace TagLedger {

// Note: if you change this type, change the Outcome enum in tag_ledger.proto as well!
enum LedgerError : uint32_t
{
	ERR_NO_ERROR,
	// Malformed prefix, padding, start number, external id or threshold. Store untouched.
	ERR_VALIDATION_FAILURE,
	// Allocation retries exhausted. Nothing was reserved; the caller may retry.
	ERR_TRANSIENT_ALLOCATION_FAILURE,
	ERR_UNKNOWN_TAG,
	ERR_CONFIRMATION_CONFLICT,
	ERR_WOULD_CAUSE_COLLISION,
	ERR_STORE_FAILURE,
};

const char* LedgerErrorToString(LedgerError error);

// Result of a single store primitive.
enum StoreStatus : uint32_t
{
	STORE_OK,
	STORE_NOT_FOUND,
	// Uniqueness or CHECK constraint rejected the write.
	STORE_CONSTRAINT,
	// Another writer holds the lock past the busy timeout.
	STORE_BUSY,
	STORE_ERROR,
};

const char* StoreStatusToString(StoreStatus status);

} // namespace TagLedger
