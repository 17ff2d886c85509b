#include "sqlite_ledger_store.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace TagLedger {

namespace {

constexpr char kSchemaSQL[] = R"SQL(
CREATE TABLE IF NOT EXISTS asset_tags (
	prefix TEXT NOT NULL,
	tag_number INTEGER NOT NULL CHECK (tag_number > 0 AND tag_number < 9223372036854775807),
	full_tag TEXT NOT NULL UNIQUE,
	external_id INTEGER NULL,
	reserved_at INTEGER NOT NULL DEFAULT (CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER)),
	confirmed_at INTEGER NULL,
	PRIMARY KEY (prefix, tag_number),
	CHECK ((external_id IS NULL) = (confirmed_at IS NULL))
);
CREATE INDEX IF NOT EXISTS idx_asset_tags_unconfirmed
	ON asset_tags (reserved_at) WHERE external_id IS NULL;

CREATE TRIGGER IF NOT EXISTS asset_tags_identity_immutable
BEFORE UPDATE OF prefix, tag_number, full_tag, reserved_at ON asset_tags
WHEN NEW.prefix IS NOT OLD.prefix OR NEW.tag_number IS NOT OLD.tag_number
	OR NEW.full_tag IS NOT OLD.full_tag OR NEW.reserved_at IS NOT OLD.reserved_at
BEGIN
	SELECT RAISE(ABORT, 'asset tag identity is immutable');
END;

CREATE TRIGGER IF NOT EXISTS asset_tags_confirm_once
BEFORE UPDATE OF external_id, confirmed_at ON asset_tags
WHEN OLD.external_id IS NOT NULL
	AND (NEW.external_id IS NOT OLD.external_id OR NEW.confirmed_at IS NOT OLD.confirmed_at)
BEGIN
	SELECT RAISE(ABORT, 'asset tag already confirmed');
END;

CREATE TRIGGER IF NOT EXISTS asset_tags_never_deleted
BEFORE DELETE ON asset_tags
BEGIN
	SELECT RAISE(ABORT, 'asset tags are never deleted');
END;

CREATE TABLE IF NOT EXISTS tag_sequences (
	prefix TEXT PRIMARY KEY,
	next_number INTEGER NOT NULL CHECK (next_number > 0),
	updated_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS tag_confirmations (
	event_id INTEGER PRIMARY KEY AUTOINCREMENT,
	full_tag TEXT NOT NULL,
	external_id INTEGER NOT NULL,
	received_at INTEGER NOT NULL,
	outcome TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_tag_confirmations_tag ON tag_confirmations (full_tag);
)SQL";

constexpr char kRecordColumns[] =
	"prefix, tag_number, full_tag, external_id, reserved_at, confirmed_at";

StoreStatus MapResult(sqlite3* db, int rc, const char* what) {
	switch (rc & 0xff) {
		case SQLITE_OK:
		case SQLITE_DONE:
		case SQLITE_ROW:
			return STORE_OK;
		case SQLITE_CONSTRAINT:
			VLOG(2) << what << ": " << sqlite3_errmsg(db);
			return STORE_CONSTRAINT;
		case SQLITE_BUSY:
		case SQLITE_LOCKED:
			VLOG(1) << what << ": ledger busy";
			return STORE_BUSY;
		default:
			LOG(ERROR) << what << " failed (" << rc << "): " << sqlite3_errmsg(db);
			return STORE_ERROR;
	}
}

StoreStatus Exec(sqlite3* db, const char* sql, const char* what) {
	char* err_msg = nullptr;
	int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
	if (err_msg != nullptr) {
		sqlite3_free(err_msg);
	}
	return MapResult(db, rc, what);
}

StoreStatus Prepare(sqlite3* db, const std::string& sql, ScopedStmt& stmt, const char* what) {
	int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, stmt.out(), nullptr);
	return MapResult(db, rc, what);
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
	sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
	const unsigned char* text = sqlite3_column_text(stmt, column);
	if (text == nullptr) {
		return std::string();
	}
	return std::string(reinterpret_cast<const char*>(text),
			static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

TagRecord ReadRecord(sqlite3_stmt* stmt) {
	TagRecord record;
	record.is_confirmed = sqlite3_column_type(stmt, 5) != SQLITE_NULL;
	record.prefix = ColumnText(stmt, 0);
	record.tag_number = sqlite3_column_int64(stmt, 1);
	record.full_tag = ColumnText(stmt, 2);
	record.external_id = sqlite3_column_int64(stmt, 3);
	record.reserved_at = sqlite3_column_int64(stmt, 4);
	record.confirmed_at = sqlite3_column_int64(stmt, 5);
	return record;
}

class SqliteTxn final : public LedgerTxn {
	public:
		SqliteTxn(sqlite3* db, bool read_only) : db_(db), read_only_(read_only) {}

		StoreStatus NextTagNumber(const std::string& prefix, int64_t& next) override {
			int64_t counter = 0;
			{
				ScopedStmt stmt;
				StoreStatus status = Prepare(db_,
						"SELECT next_number FROM tag_sequences WHERE prefix = ?1", stmt, "read counter");
				if (status != STORE_OK) return status;
				BindText(stmt.get(), 1, prefix);
				int rc = sqlite3_step(stmt.get());
				if (rc == SQLITE_ROW) {
					counter = sqlite3_column_int64(stmt.get(), 0);
				} else if (rc != SQLITE_DONE) {
					return MapResult(db_, rc, "read counter");
				}
			}
			if (counter == 0) {
				int64_t max_number = 0;
				StoreStatus status = MaxTagNumber(prefix, max_number);
				if (status != STORE_OK) return status;
				counter = max_number + 1;
			}

			// First free number at or after the counter. Only differs from the
			// counter after a forced reset into already-issued numbers.
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"SELECT MIN(c.n) FROM ("
					"  SELECT ?2 AS n"
					"  UNION ALL"
					"  SELECT tag_number + 1 FROM asset_tags WHERE prefix = ?1 AND tag_number >= ?2"
					") AS c "
					"WHERE NOT EXISTS (SELECT 1 FROM asset_tags t WHERE t.prefix = ?1 AND t.tag_number = c.n)",
					stmt, "find next tag number");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, prefix);
			sqlite3_bind_int64(stmt.get(), 2, counter);
			int rc = sqlite3_step(stmt.get());
			if (rc != SQLITE_ROW) {
				return MapResult(db_, rc, "find next tag number");
			}
			next = sqlite3_column_int64(stmt.get(), 0);
			return STORE_OK;
		}

		StoreStatus MaxTagNumber(const std::string& prefix, int64_t& max_number) override {
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"SELECT COALESCE(MAX(tag_number), 0) FROM asset_tags WHERE prefix = ?1",
					stmt, "read max tag number");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, prefix);
			int rc = sqlite3_step(stmt.get());
			if (rc != SQLITE_ROW) {
				return MapResult(db_, rc, "read max tag number");
			}
			max_number = sqlite3_column_int64(stmt.get(), 0);
			return STORE_OK;
		}

		StoreStatus InsertReserved(const TagRecord& record) override {
			if (!CheckWritable("insert reserved tag")) return STORE_ERROR;
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"INSERT INTO asset_tags (prefix, tag_number, full_tag, reserved_at) VALUES (?1, ?2, ?3, ?4)",
					stmt, "insert reserved tag");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, record.prefix);
			sqlite3_bind_int64(stmt.get(), 2, record.tag_number);
			BindText(stmt.get(), 3, record.full_tag);
			sqlite3_bind_int64(stmt.get(), 4, record.reserved_at);
			return MapResult(db_, sqlite3_step(stmt.get()), "insert reserved tag");
		}

		StoreStatus SetNextTagNumber(const std::string& prefix, int64_t next, TimestampMs now) override {
			if (!CheckWritable("set next tag number")) return STORE_ERROR;
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"INSERT OR REPLACE INTO tag_sequences (prefix, next_number, updated_at) VALUES (?1, ?2, ?3)",
					stmt, "set next tag number");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, prefix);
			sqlite3_bind_int64(stmt.get(), 2, next);
			sqlite3_bind_int64(stmt.get(), 3, now);
			return MapResult(db_, sqlite3_step(stmt.get()), "set next tag number");
		}

		StoreStatus FindByFullTag(const std::string& full_tag, TagRecord& record) override {
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					std::string("SELECT ") + kRecordColumns + " FROM asset_tags WHERE full_tag = ?1",
					stmt, "find tag");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, full_tag);
			int rc = sqlite3_step(stmt.get());
			if (rc == SQLITE_DONE) {
				return STORE_NOT_FOUND;
			}
			if (rc != SQLITE_ROW) {
				return MapResult(db_, rc, "find tag");
			}
			record = ReadRecord(stmt.get());
			return STORE_OK;
		}

		StoreStatus MarkConfirmed(const std::string& full_tag, int64_t external_id, TimestampMs now) override {
			if (!CheckWritable("mark confirmed")) return STORE_ERROR;
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"UPDATE asset_tags SET external_id = ?2, confirmed_at = ?3 "
					"WHERE full_tag = ?1 AND external_id IS NULL",
					stmt, "mark confirmed");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, full_tag);
			sqlite3_bind_int64(stmt.get(), 2, external_id);
			sqlite3_bind_int64(stmt.get(), 3, now);
			status = MapResult(db_, sqlite3_step(stmt.get()), "mark confirmed");
			if (status != STORE_OK) return status;
			return sqlite3_changes(db_) == 1 ? STORE_OK : STORE_NOT_FOUND;
		}

		StoreStatus AppendConfirmationEvent(const ConfirmationEvent& event) override {
			if (!CheckWritable("journal confirmation")) return STORE_ERROR;
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"INSERT INTO tag_confirmations (full_tag, external_id, received_at, outcome) "
					"VALUES (?1, ?2, ?3, ?4)",
					stmt, "journal confirmation");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, event.full_tag);
			sqlite3_bind_int64(stmt.get(), 2, event.external_id);
			sqlite3_bind_int64(stmt.get(), 3, event.received_at);
			sqlite3_bind_text(stmt.get(), 4, ConfirmationOutcomeToString(event.outcome), -1, SQLITE_STATIC);
			return MapResult(db_, sqlite3_step(stmt.get()), "journal confirmation");
		}

		StoreStatus ListConfirmationEvents(const std::string& full_tag,
				std::vector<ConfirmationEvent>& events) override {
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					"SELECT event_id, full_tag, external_id, received_at, outcome FROM tag_confirmations "
					"WHERE full_tag = ?1 ORDER BY event_id",
					stmt, "list confirmations");
			if (status != STORE_OK) return status;
			BindText(stmt.get(), 1, full_tag);
			int rc;
			while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
				ConfirmationEvent event;
				event.event_id = sqlite3_column_int64(stmt.get(), 0);
				event.full_tag = ColumnText(stmt.get(), 1);
				event.external_id = sqlite3_column_int64(stmt.get(), 2);
				event.received_at = sqlite3_column_int64(stmt.get(), 3);
				std::string outcome = ColumnText(stmt.get(), 4);
				if (!ParseConfirmationOutcome(outcome, event.outcome)) {
					LOG(ERROR) << "Unrecognised confirmation outcome '" << outcome
						<< "' in journal entry " << event.event_id;
					return STORE_ERROR;
				}
				events.push_back(std::move(event));
			}
			return MapResult(db_, rc, "list confirmations");
		}

		StoreStatus ListUnconfirmedBefore(TimestampMs cutoff, const std::string& prefix,
				std::vector<TagRecord>& records) override {
			ScopedStmt stmt;
			StoreStatus status = Prepare(db_,
					std::string("SELECT ") + kRecordColumns + " FROM asset_tags "
					"WHERE external_id IS NULL AND reserved_at < ?1 AND (?2 = '' OR prefix = ?2) "
					"ORDER BY prefix, tag_number",
					stmt, "list unconfirmed");
			if (status != STORE_OK) return status;
			sqlite3_bind_int64(stmt.get(), 1, cutoff);
			BindText(stmt.get(), 2, prefix);
			int rc;
			while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
				records.push_back(ReadRecord(stmt.get()));
			}
			return MapResult(db_, rc, "list unconfirmed");
		}

	private:
		bool CheckWritable(const char* what) const {
			if (read_only_) {
				LOG(ERROR) << what << " attempted inside a read transaction";
				return false;
			}
			return true;
		}

		sqlite3* db_;
		bool read_only_;
};

// Rolls back unless the transaction was finished explicitly.
class TxnGuard {
	public:
		explicit TxnGuard(sqlite3* db) : db_(db) {}
		~TxnGuard() {
			if (active_) {
				Exec(db_, "ROLLBACK", "rollback");
			}
		}
		TxnGuard(const TxnGuard&) = delete;
		TxnGuard& operator=(const TxnGuard&) = delete;

		StoreStatus Commit() {
			StoreStatus status = Exec(db_, "COMMIT", "commit");
			// A failed COMMIT leaves the transaction open; the destructor rolls it back.
			if (status == STORE_OK) {
				active_ = false;
			}
			return status;
		}

	private:
		sqlite3* db_;
		bool active_ = true;
};

} // namespace

TimestampMs SystemNowMs() {
	return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();
}

SqliteLedgerStore::SqliteLedgerStore(const SqliteStoreOptions& options)
	: path_(options.path),
	clock_(options.clock ? options.clock : std::function<TimestampMs()>(SystemNowMs)) {
	sqlite3* raw = nullptr;
	int rc = sqlite3_open_v2(path_.c_str(), &raw,
			SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
	db_ = ScopedDb(raw);
	if (rc != SQLITE_OK) {
		std::string msg = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
		throw std::runtime_error("Failed to open ledger " + path_ + ": " + msg);
	}

	sqlite3_busy_timeout(db_.get(), options.busy_timeout_ms);
	sqlite3_extended_result_codes(db_.get(), 1);

	std::string pragma = "PRAGMA journal_mode=" + options.journal_mode;
	if (Exec(db_.get(), pragma.c_str(), "set journal mode") != STORE_OK) {
		throw std::runtime_error("Failed to set journal mode " + options.journal_mode + " on " + path_);
	}
	if (Exec(db_.get(), "PRAGMA synchronous=NORMAL", "set synchronous") != STORE_OK) {
		throw std::runtime_error("Failed to configure synchronous mode on " + path_);
	}
	if (Exec(db_.get(), kSchemaSQL, "apply schema") != STORE_OK) {
		throw std::runtime_error("Failed to apply ledger schema to " + path_);
	}
	VLOG(1) << "Opened ledger " << path_ << " (journal_mode=" << options.journal_mode
		<< ", busy_timeout_ms=" << options.busy_timeout_ms << ")";
}

StoreStatus SqliteLedgerStore::RunTransaction(const char* begin_sql, bool read_only, const TxnBody& body) {
	absl::MutexLock lock(&mutex_);
	StoreStatus status = Exec(db_.get(), begin_sql, "begin transaction");
	if (status != STORE_OK) {
		return status;
	}
	TxnGuard guard(db_.get());
	SqliteTxn txn(db_.get(), read_only);
	status = body(txn);
	if (status != STORE_OK) {
		return status;
	}
	return guard.Commit();
}

StoreStatus SqliteLedgerStore::Write(const TxnBody& body) {
	return RunTransaction("BEGIN IMMEDIATE", false, body);
}

StoreStatus SqliteLedgerStore::Read(const TxnBody& body) {
	return RunTransaction("BEGIN DEFERRED", true, body);
}

TimestampMs SqliteLedgerStore::NowMs() const {
	return clock_();
}

} // namespace TagLedger
