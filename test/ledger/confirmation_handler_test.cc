#include <gtest/gtest.h>
#include <vector>
#include "ledger/confirmation_handler.h"
#include "ledger/sequence_allocator.h"
#include "ledger_test_util.h"

using namespace TagLedger;
using namespace TagLedger::testing_util;

class ConfirmationHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = OpenStore(file_.path(), clock_.AsFunction());
        handler_ = std::make_unique<ConfirmationHandler>(*store_);
        SequenceAllocator allocator(*store_);
        ASSERT_EQ(allocator.Allocate("W12", 4, tag_), ERR_NO_ERROR);
        ASSERT_EQ(tag_, "W12-0001");
    }

    TagRecord Find(const std::string& full_tag) {
        TagRecord record;
        EXPECT_EQ(store_->Read([&](LedgerTxn& txn) { return txn.FindByFullTag(full_tag, record); }), STORE_OK);
        return record;
    }

    TempLedgerFile file_;
    ManualClock clock_;
    std::unique_ptr<SqliteLedgerStore> store_;
    std::unique_ptr<ConfirmationHandler> handler_;
    std::string tag_;
};

TEST_F(ConfirmationHandlerTest, FirstConfirmationLinksRecord) {
    clock_.Advance(5000);
    ConfirmationOutcome outcome = ConfirmationOutcome::UNKNOWN_TAG;
    ASSERT_EQ(handler_->Confirm(tag_, 42, &outcome), ERR_NO_ERROR);
    EXPECT_EQ(outcome, ConfirmationOutcome::CONFIRMED);

    TagRecord record = Find(tag_);
    EXPECT_EQ(record.external_id, 42);
    EXPECT_EQ(record.confirmed_at, clock_.Now());
    EXPECT_LT(record.reserved_at, record.confirmed_at);
}

TEST_F(ConfirmationHandlerTest, RepeatedDeliveryIsIdempotent) {
    ASSERT_EQ(handler_->Confirm(tag_, 42), ERR_NO_ERROR);
    TimestampMs first_confirmed_at = Find(tag_).confirmed_at;

    clock_.Advance(60000);
    ConfirmationOutcome outcome = ConfirmationOutcome::CONFIRMED;
    ASSERT_EQ(handler_->Confirm(tag_, 42, &outcome), ERR_NO_ERROR);
    EXPECT_EQ(outcome, ConfirmationOutcome::DUPLICATE);
    EXPECT_EQ(Find(tag_).confirmed_at, first_confirmed_at);
}

TEST_F(ConfirmationHandlerTest, ConflictingDeliveryLeavesOriginalLink) {
    ASSERT_EQ(handler_->Confirm(tag_, 42), ERR_NO_ERROR);

    ConfirmationOutcome outcome = ConfirmationOutcome::CONFIRMED;
    EXPECT_EQ(handler_->Confirm(tag_, 43, &outcome), ERR_CONFIRMATION_CONFLICT);
    EXPECT_EQ(outcome, ConfirmationOutcome::CONFLICT);
    EXPECT_EQ(Find(tag_).external_id, 42);
}

TEST_F(ConfirmationHandlerTest, UnknownTagChangesNothing) {
    ConfirmationOutcome outcome = ConfirmationOutcome::CONFIRMED;
    EXPECT_EQ(handler_->Confirm("W12-0999", 42, &outcome), ERR_UNKNOWN_TAG);
    EXPECT_EQ(outcome, ConfirmationOutcome::UNKNOWN_TAG);

    TagRecord record;
    EXPECT_EQ(store_->Read([&](LedgerTxn& txn) { return txn.FindByFullTag("W12-0999", record); }),
            STORE_NOT_FOUND);
    EXPECT_FALSE(Find(tag_).confirmed());
}

TEST_F(ConfirmationHandlerTest, RejectsInvalidInput) {
    EXPECT_EQ(handler_->Confirm("", 42), ERR_VALIDATION_FAILURE);
    EXPECT_FALSE(Find(tag_).confirmed());

    std::vector<ConfirmationEvent> events;
    ASSERT_EQ(handler_->History(tag_, events), ERR_NO_ERROR);
    EXPECT_TRUE(events.empty());
}

TEST_F(ConfirmationHandlerTest, ZeroExternalIdIsAValidLink) {
    ConfirmationOutcome outcome = ConfirmationOutcome::UNKNOWN_TAG;
    ASSERT_EQ(handler_->Confirm(tag_, 0, &outcome), ERR_NO_ERROR);
    EXPECT_EQ(outcome, ConfirmationOutcome::CONFIRMED);

    TagRecord record = Find(tag_);
    EXPECT_TRUE(record.confirmed());
    EXPECT_EQ(record.external_id, 0);
    EXPECT_EQ(record.confirmed_at, clock_.Now());

    ASSERT_EQ(handler_->Confirm(tag_, 0, &outcome), ERR_NO_ERROR);
    EXPECT_EQ(outcome, ConfirmationOutcome::DUPLICATE);
    EXPECT_EQ(handler_->Confirm(tag_, 42, &outcome), ERR_CONFIRMATION_CONFLICT);
    EXPECT_EQ(Find(tag_).external_id, 0);
}

TEST_F(ConfirmationHandlerTest, NegativeExternalIdIsAccepted) {
    ASSERT_EQ(handler_->Confirm(tag_, -7), ERR_NO_ERROR);
    TagRecord record = Find(tag_);
    EXPECT_TRUE(record.confirmed());
    EXPECT_EQ(record.external_id, -7);
}

TEST_F(ConfirmationHandlerTest, EveryDeliveryIsJournaled) {
    ASSERT_EQ(handler_->Confirm(tag_, 42), ERR_NO_ERROR);
    clock_.Advance(10);
    ASSERT_EQ(handler_->Confirm(tag_, 42), ERR_NO_ERROR);
    clock_.Advance(10);
    ASSERT_EQ(handler_->Confirm(tag_, 43), ERR_CONFIRMATION_CONFLICT);
    ASSERT_EQ(handler_->Confirm("W12-0999", 44), ERR_UNKNOWN_TAG);

    std::vector<ConfirmationEvent> events;
    ASSERT_EQ(handler_->History(tag_, events), ERR_NO_ERROR);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].outcome, ConfirmationOutcome::CONFIRMED);
    EXPECT_EQ(events[1].outcome, ConfirmationOutcome::DUPLICATE);
    EXPECT_EQ(events[2].outcome, ConfirmationOutcome::CONFLICT);
    EXPECT_EQ(events[2].external_id, 43);
    EXPECT_EQ(events[2].received_at, events[0].received_at + 20);

    ASSERT_EQ(handler_->History("W12-0999", events), ERR_NO_ERROR);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].outcome, ConfirmationOutcome::UNKNOWN_TAG);
}
