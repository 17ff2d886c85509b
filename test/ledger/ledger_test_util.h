#pragma once

#include <atomic>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <unistd.h>

#include "ledger/sqlite_ledger_store.h"

namespace TagLedger {
namespace testing_util {

// Unique ledger path under /tmp, removed (with its WAL side files) on destruction.
class TempLedgerFile {
public:
    TempLedgerFile() {
        static std::atomic<int> counter{0};
        path_ = "/tmp/tagledger_test_" + std::to_string(getpid()) + "_" +
            std::to_string(counter.fetch_add(1)) + ".db";
        Remove();
    }
    ~TempLedgerFile() { Remove(); }

    TempLedgerFile(const TempLedgerFile&) = delete;
    TempLedgerFile& operator=(const TempLedgerFile&) = delete;

    const std::string& path() const { return path_; }

private:
    void Remove() {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
    }

    std::string path_;
};

// Settable clock shared between a test and the store it injects into.
class ManualClock {
public:
    explicit ManualClock(TimestampMs start = 1700000000000) : now_(std::make_shared<std::atomic<TimestampMs>>(start)) {}

    TimestampMs Now() const { return now_->load(); }
    void Set(TimestampMs value) { now_->store(value); }
    void Advance(TimestampMs delta_ms) { now_->fetch_add(delta_ms); }

    std::function<TimestampMs()> AsFunction() const {
        auto now = now_;
        return [now]() { return now->load(); };
    }

private:
    std::shared_ptr<std::atomic<TimestampMs>> now_;
};

inline std::unique_ptr<SqliteLedgerStore> OpenStore(const std::string& path,
        std::function<TimestampMs()> clock = nullptr, int busy_timeout_ms = 5000) {
    SqliteStoreOptions options;
    options.path = path;
    options.busy_timeout_ms = busy_timeout_ms;
    options.clock = std::move(clock);
    return std::make_unique<SqliteLedgerStore>(options);
}

} // namespace testing_util
} // namespace TagLedger
