#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <set>
#include <thread>
#include <vector>
#include "common/config.h"
#include "ledger/sequence_allocator.h"
#include "ledger_test_util.h"

using namespace TagLedger;
using namespace TagLedger::testing_util;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Field;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

class MockLedgerTxn : public LedgerTxn {
public:
    MOCK_METHOD(StoreStatus, NextTagNumber, (const std::string& prefix, int64_t& next), (override));
    MOCK_METHOD(StoreStatus, MaxTagNumber, (const std::string& prefix, int64_t& max_number), (override));
    MOCK_METHOD(StoreStatus, InsertReserved, (const TagRecord& record), (override));
    MOCK_METHOD(StoreStatus, SetNextTagNumber, (const std::string& prefix, int64_t next, TimestampMs now),
            (override));
    MOCK_METHOD(StoreStatus, FindByFullTag, (const std::string& full_tag, TagRecord& record), (override));
    MOCK_METHOD(StoreStatus, MarkConfirmed, (const std::string& full_tag, int64_t external_id, TimestampMs now),
            (override));
    MOCK_METHOD(StoreStatus, AppendConfirmationEvent, (const ConfirmationEvent& event), (override));
    MOCK_METHOD(StoreStatus, ListConfirmationEvents,
            (const std::string& full_tag, std::vector<ConfirmationEvent>& events), (override));
    MOCK_METHOD(StoreStatus, ListUnconfirmedBefore,
            (TimestampMs cutoff, const std::string& prefix, std::vector<TagRecord>& records), (override));
};

// Runs every transaction body against the mock. Can be told to report the
// write lock as busy for the next few Write calls without running the body.
class FakeStore : public ILedgerStore {
public:
    explicit FakeStore(MockLedgerTxn& txn) : txn_(txn) {}

    StoreStatus Write(const TxnBody& body) override {
        ++writes;
        if (busy_writes > 0) {
            --busy_writes;
            return STORE_BUSY;
        }
        return body(txn_);
    }
    StoreStatus Read(const TxnBody& body) override { return body(txn_); }
    TimestampMs NowMs() const override { return 1000; }

    int writes = 0;
    int busy_writes = 0;

private:
    MockLedgerTxn& txn_;
};

} // namespace

class SequenceAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = OpenStore(file_.path());
        allocator_ = std::make_unique<SequenceAllocator>(*store_);
    }

    TempLedgerFile file_;
    std::unique_ptr<SqliteLedgerStore> store_;
    std::unique_ptr<SequenceAllocator> allocator_;
};

TEST_F(SequenceAllocatorTest, IssuesContiguousTagsFromOne) {
    std::string tag;
    int64_t number = 0;
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag, &number), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-0001");
    EXPECT_EQ(number, 1);
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-0002");
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-0003");
}

TEST_F(SequenceAllocatorTest, PrefixesHaveIndependentSequences) {
    std::string tag;
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag), ERR_NO_ERROR);
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag), ERR_NO_ERROR);
    ASSERT_EQ(allocator_->Allocate("LAB", 4, tag), ERR_NO_ERROR);
    EXPECT_EQ(tag, "LAB-0001");
}

TEST_F(SequenceAllocatorTest, NumbersBeyondPaddingAreEmittedInFull) {
    ASSERT_EQ(store_->Write([&](LedgerTxn& txn) { return txn.SetNextTagNumber("W12", 12345, 1); }), STORE_OK);
    std::string tag;
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-12345");
}

TEST_F(SequenceAllocatorTest, RejectsInvalidInput) {
    std::string tag = "untouched";
    EXPECT_EQ(allocator_->Allocate("", 4, tag), ERR_VALIDATION_FAILURE);
    EXPECT_EQ(allocator_->Allocate("W-12", 4, tag), ERR_VALIDATION_FAILURE);
    EXPECT_EQ(allocator_->Allocate("W12", -1, tag), ERR_VALIDATION_FAILURE);
    EXPECT_EQ(tag, "untouched");

    int64_t next = 0;
    ASSERT_EQ(store_->Read([&](LedgerTxn& txn) { return txn.NextTagNumber("W12", next); }), STORE_OK);
    EXPECT_EQ(next, 1);
}

// Independent connections to one ledger file racing for the same prefix.
TEST_F(SequenceAllocatorTest, ConcurrentWorkersNeverShareATag) {
    constexpr int kWorkers = 8;
    constexpr int kPerWorker = 40;

    std::vector<std::unique_ptr<SqliteLedgerStore>> stores;
    for (int i = 0; i < kWorkers; ++i) {
        stores.push_back(OpenStore(file_.path(), nullptr, 60000));
    }

    std::vector<std::vector<std::string>> issued(kWorkers);
    std::vector<int> failures(kWorkers, 0);
    std::vector<std::thread> workers;
    for (int i = 0; i < kWorkers; ++i) {
        workers.emplace_back([&, i]() {
            AllocatorOptions options;
            options.max_attempts = 64;
            SequenceAllocator allocator(*stores[i], options);
            for (int j = 0; j < kPerWorker; ++j) {
                std::string tag;
                if (allocator.Allocate("W12", 4, tag) == ERR_NO_ERROR) {
                    issued[i].push_back(tag);
                } else {
                    ++failures[i];
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::set<std::string> unique;
    size_t total = 0;
    for (int i = 0; i < kWorkers; ++i) {
        EXPECT_EQ(failures[i], 0);
        total += issued[i].size();
        unique.insert(issued[i].begin(), issued[i].end());
    }
    EXPECT_EQ(total, static_cast<size_t>(kWorkers * kPerWorker));
    EXPECT_EQ(unique.size(), total);

    // No gaps: the issued set is exactly 1..N.
    std::string tag;
    ASSERT_EQ(allocator_->Allocate("W12", 4, tag), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-0321");
}

// One Allocate per thread so that hundreds of calls are in flight at once,
// spread over a pool of connections to the same ledger file.
TEST_F(SequenceAllocatorTest, HundredsOfSimultaneousCallsStayUnique) {
    constexpr int kConnections = 32;
    constexpr int kCalls = 256;

    std::vector<std::unique_ptr<SqliteLedgerStore>> stores;
    for (int i = 0; i < kConnections; ++i) {
        stores.push_back(OpenStore(file_.path(), nullptr, 60000));
    }

    std::vector<std::string> issued(kCalls);
    std::vector<LedgerError> results(kCalls, ERR_STORE_FAILURE);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCalls; ++i) {
        callers.emplace_back([&, i]() {
            AllocatorOptions options;
            options.max_attempts = 64;
            SequenceAllocator allocator(*stores[i % kConnections], options);
            results[i] = allocator.Allocate("W12", 4, issued[i]);
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    std::set<std::string> unique;
    for (int i = 0; i < kCalls; ++i) {
        EXPECT_EQ(results[i], ERR_NO_ERROR) << "call " << i;
        unique.insert(issued[i]);
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(kCalls));
    EXPECT_EQ(*unique.begin(), "W12-0001");
    EXPECT_EQ(*unique.rbegin(), "W12-0256");
}

TEST(SequenceAllocatorRetryTest, ConstraintMovesToNextCandidate) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    SequenceAllocator allocator(store);

    EXPECT_CALL(txn, NextTagNumber("W12", _)).WillOnce(DoAll(SetArgReferee<1>(7), Return(STORE_OK)));
    EXPECT_CALL(txn, InsertReserved(Field(&TagRecord::tag_number, 7))).WillOnce(Return(STORE_CONSTRAINT));
    EXPECT_CALL(txn, InsertReserved(Field(&TagRecord::tag_number, 8))).WillOnce(Return(STORE_OK));
    EXPECT_CALL(txn, SetNextTagNumber("W12", 9, 1000)).WillOnce(Return(STORE_OK));

    std::string tag;
    int64_t number = 0;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag, &number), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-0008");
    EXPECT_EQ(number, 8);
    EXPECT_EQ(store.writes, 1);
}

TEST(SequenceAllocatorRetryTest, ExhaustedAttemptsIsTransientFailure) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    AllocatorOptions options;
    options.max_attempts = 3;
    SequenceAllocator allocator(store, options);

    EXPECT_CALL(txn, NextTagNumber("W12", _)).WillOnce(DoAll(SetArgReferee<1>(1), Return(STORE_OK)));
    EXPECT_CALL(txn, InsertReserved(_)).Times(3).WillRepeatedly(Return(STORE_CONSTRAINT));
    EXPECT_CALL(txn, SetNextTagNumber(_, _, _)).Times(0);

    std::string tag;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag), ERR_TRANSIENT_ALLOCATION_FAILURE);
    EXPECT_TRUE(tag.empty());
}

TEST(SequenceAllocatorRetryTest, BusyStoreIsRetriedWithinBudget) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    AllocatorOptions options;
    options.max_attempts = 4;
    options.retry_backoff_ms = 0;
    SequenceAllocator allocator(store, options);
    store.busy_writes = 2;

    EXPECT_CALL(txn, NextTagNumber("W12", _)).WillOnce(DoAll(SetArgReferee<1>(3), Return(STORE_OK)));
    EXPECT_CALL(txn, InsertReserved(Field(&TagRecord::full_tag, "W12-0003"))).WillOnce(Return(STORE_OK));
    EXPECT_CALL(txn, SetNextTagNumber("W12", 4, _)).WillOnce(Return(STORE_OK));

    std::string tag;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag), ERR_NO_ERROR);
    EXPECT_EQ(tag, "W12-0003");
    EXPECT_EQ(store.writes, 3);
}

TEST(SequenceAllocatorRetryTest, PersistentlyBusyStoreGivesUp) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    AllocatorOptions options;
    options.max_attempts = 3;
    options.retry_backoff_ms = 0;
    SequenceAllocator allocator(store, options);
    store.busy_writes = 100;

    EXPECT_CALL(txn, NextTagNumber(_, _)).Times(0);

    std::string tag;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag), ERR_TRANSIENT_ALLOCATION_FAILURE);
    EXPECT_EQ(store.writes, 3);
}

TEST(SequenceAllocatorRetryTest, ExhaustedSequenceIsNotRetried) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    SequenceAllocator allocator(store);

    EXPECT_CALL(txn, NextTagNumber("W12", _))
        .WillOnce(DoAll(SetArgReferee<1>(kMaxTagNumber + 1), Return(STORE_OK)));
    EXPECT_CALL(txn, InsertReserved(_)).Times(0);
    EXPECT_CALL(txn, SetNextTagNumber(_, _, _)).Times(0);

    std::string tag;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag), ERR_STORE_FAILURE);
    EXPECT_TRUE(tag.empty());
    EXPECT_EQ(store.writes, 1);
}

TEST(SequenceAllocatorRetryTest, RejectedCounterIsStoreFailure) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    SequenceAllocator allocator(store);

    EXPECT_CALL(txn, NextTagNumber("W12", _)).WillOnce(DoAll(SetArgReferee<1>(5), Return(STORE_OK)));
    EXPECT_CALL(txn, InsertReserved(Field(&TagRecord::tag_number, 5))).WillOnce(Return(STORE_OK));
    EXPECT_CALL(txn, SetNextTagNumber("W12", 6, _)).WillOnce(Return(STORE_CONSTRAINT));

    std::string tag;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag), ERR_STORE_FAILURE);
    EXPECT_TRUE(tag.empty());
    EXPECT_EQ(store.writes, 1);
}

TEST(SequenceAllocatorRetryTest, StoreErrorIsNotRetried) {
    MockLedgerTxn txn;
    FakeStore store(txn);
    SequenceAllocator allocator(store);

    EXPECT_CALL(txn, NextTagNumber("W12", _)).WillOnce(DoAll(SetArgReferee<1>(1), Return(STORE_OK)));
    EXPECT_CALL(txn, InsertReserved(_)).WillOnce(Return(STORE_ERROR));

    std::string tag;
    EXPECT_EQ(allocator.Allocate("W12", 4, tag), ERR_STORE_FAILURE);
    EXPECT_EQ(store.writes, 1);
}
