#pragma once

#include <functional>
#include <string>
#include <vector>
#include "ledger_error.h"
#include "tag_record.h"

namespace TagLedger {

/**
 * Store primitives available inside one ledger transaction.
 * Obtained only through ILedgerStore::Write / ILedgerStore::Read, so every
 * call runs under the transaction the store opened for it.
 */
class LedgerTxn {
public:
	virtual ~LedgerTxn() = default;

	// Smallest number >= the prefix's counter that is not yet issued.
	// Counter defaults to max(tag_number) + 1, or 1 for an unused prefix.
	virtual StoreStatus NextTagNumber(const std::string& prefix, int64_t& next) = 0;

	// 0 when nothing has been issued for the prefix.
	virtual StoreStatus MaxTagNumber(const std::string& prefix, int64_t& max_number) = 0;

	// STORE_CONSTRAINT when (prefix, tag_number) or full_tag already exists.
	virtual StoreStatus InsertReserved(const TagRecord& record) = 0;

	virtual StoreStatus SetNextTagNumber(const std::string& prefix, int64_t next, TimestampMs now) = 0;

	virtual StoreStatus FindByFullTag(const std::string& full_tag, TagRecord& record) = 0;

	// Only fills an unconfirmed row. STORE_NOT_FOUND if the row is missing or already confirmed.
	virtual StoreStatus MarkConfirmed(const std::string& full_tag, int64_t external_id, TimestampMs now) = 0;

	virtual StoreStatus AppendConfirmationEvent(const ConfirmationEvent& event) = 0;

	virtual StoreStatus ListConfirmationEvents(const std::string& full_tag,
			std::vector<ConfirmationEvent>& events) = 0;

	// Unconfirmed rows reserved strictly before the cutoff. Empty prefix means all prefixes.
	virtual StoreStatus ListUnconfirmedBefore(TimestampMs cutoff, const std::string& prefix,
			std::vector<TagRecord>& records) = 0;
};

/**
 * Durable ledger. The store is the only synchronization point between
 * allocating workers: Write bodies are serialized against every other writer
 * of the same ledger, in this process or another.
 */
class ILedgerStore {
public:
	using TxnBody = std::function<StoreStatus(LedgerTxn&)>;

	virtual ~ILedgerStore() = default;

	// Commits when body returns STORE_OK, rolls back otherwise.
	// STORE_BUSY when the write lock (or the commit) timed out.
	virtual StoreStatus Write(const TxnBody& body) = 0;

	// Consistent read-only snapshot; takes no write lock.
	virtual StoreStatus Read(const TxnBody& body) = 0;

	virtual TimestampMs NowMs() const = 0;
};

} // namespace TagLedger
