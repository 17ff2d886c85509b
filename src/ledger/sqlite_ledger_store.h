#pragma once

#include <functional>
#include <string>

#include "absl/synchronization/mutex.h"
#include "../common/config.h"
#include "../common/sqlite_handle.h"
#include "interfaces.h"

namespace TagLedger {

TimestampMs SystemNowMs();

struct SqliteStoreOptions {
	std::string path;
	int busy_timeout_ms = kDefaultBusyTimeoutMs;
	std::string journal_mode = "WAL";
	// Defaults to SystemNowMs. Tests inject a fixed clock.
	std::function<TimestampMs()> clock;
};

/**
 * ILedgerStore over one SQLite connection.
 *
 * Writes run under BEGIN IMMEDIATE, which takes the database write lock up
 * front, so the read-compute-insert of an allocation is serialized against
 * every other connection to the same file. Reads run in a deferred
 * transaction and never block on writers in WAL mode.
 *
 * One transaction at a time per instance; concurrent callers on the same
 * instance queue on mutex_. Independent workers should open their own store.
 */
class SqliteLedgerStore : public ILedgerStore {
public:
	// Opens (creating if needed) the ledger file and applies the schema.
	// Throws std::runtime_error if either step fails.
	explicit SqliteLedgerStore(const SqliteStoreOptions& options);
	~SqliteLedgerStore() override = default;

	SqliteLedgerStore(const SqliteLedgerStore&) = delete;
	SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

	StoreStatus Write(const TxnBody& body) override;
	StoreStatus Read(const TxnBody& body) override;
	TimestampMs NowMs() const override;

	const std::string& path() const { return path_; }

private:
	StoreStatus RunTransaction(const char* begin_sql, bool read_only, const TxnBody& body);

	std::string path_;
	std::function<TimestampMs()> clock_;
	absl::Mutex mutex_;
	ScopedDb db_;
};

} // namespace TagLedger
