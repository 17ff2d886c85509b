// RAII wrappers for sqlite3 connections and prepared statements.
// Ensures handles are released on scope exit, including early return.
#ifndef TAGLEDGER_SRC_COMMON_SQLITE_HANDLE_H_
#define TAGLEDGER_SRC_COMMON_SQLITE_HANDLE_H_

#include <sqlite3.h>

namespace TagLedger {

struct ScopedDb {
	sqlite3* db = nullptr;

	ScopedDb() = default;
	explicit ScopedDb(sqlite3* d) : db(d) {}

	~ScopedDb() {
		if (db != nullptr) {
			sqlite3_close_v2(db);
			db = nullptr;
		}
	}

	ScopedDb(const ScopedDb&) = delete;
	ScopedDb& operator=(const ScopedDb&) = delete;

	ScopedDb(ScopedDb&& o) noexcept : db(o.db) { o.db = nullptr; }
	ScopedDb& operator=(ScopedDb&& o) noexcept {
		if (this != &o) {
			if (db != nullptr) sqlite3_close_v2(db);
			db = o.db;
			o.db = nullptr;
		}
		return *this;
	}

	sqlite3* get() const { return db; }
};

struct ScopedStmt {
	sqlite3_stmt* stmt = nullptr;

	ScopedStmt() = default;
	explicit ScopedStmt(sqlite3_stmt* s) : stmt(s) {}

	~ScopedStmt() {
		if (stmt != nullptr) {
			sqlite3_finalize(stmt);
			stmt = nullptr;
		}
	}

	ScopedStmt(const ScopedStmt&) = delete;
	ScopedStmt& operator=(const ScopedStmt&) = delete;

	ScopedStmt(ScopedStmt&& o) noexcept : stmt(o.stmt) { o.stmt = nullptr; }
	ScopedStmt& operator=(ScopedStmt&& o) noexcept {
		if (this != &o) {
			if (stmt != nullptr) sqlite3_finalize(stmt);
			stmt = o.stmt;
			o.stmt = nullptr;
		}
		return *this;
	}

	sqlite3_stmt* get() const { return stmt; }
	// For sqlite3_prepare_v2 output; must be empty.
	sqlite3_stmt** out() { return &stmt; }
};

} // namespace TagLedger

#endif // TAGLEDGER_SRC_COMMON_SQLITE_HANDLE_H_
