#include <gtest/gtest.h>
#include "../../src/wharf/origin_ledger.h"

using namespace Wharf;

class OriginLedgerTest : public ::testing::Test {
protected:
    OriginLedger ledger_;
    const MessageOrigin origin_ = MessageOrigin::Parent();
};

TEST_F(OriginLedgerTest, GetOrCreateIsStable) {
    BookState& book = ledger_.GetOrCreate(origin_);
    book.end = 4;
    EXPECT_EQ(&ledger_.GetOrCreate(origin_), &book);
    EXPECT_EQ(ledger_.Find(origin_)->end, 4u);
    EXPECT_EQ(ledger_.Size(), 1u);
    EXPECT_EQ(ledger_.Find(MessageOrigin::Here()), nullptr);

    // Other books do not move existing ones
    for (uint32_t id = 0; id < 100; ++id) {
        ledger_.GetOrCreate(MessageOrigin::Sibling(id));
    }
    EXPECT_EQ(ledger_.Find(origin_), &book);
}

TEST_F(OriginLedgerTest, EnqueueReportsBecomingReady) {
    BookState& book = ledger_.GetOrCreate(origin_);
    EXPECT_TRUE(ledger_.NoteEnqueued(book, 5));
    EXPECT_FALSE(ledger_.NoteEnqueued(book, 3));
    EXPECT_EQ(book.message_count, 2u);
    EXPECT_EQ(book.size, 8u);
}

TEST_F(OriginLedgerTest, ConsumeReportsBecomingEmpty) {
    BookState& book = ledger_.GetOrCreate(origin_);
    ledger_.NoteEnqueued(book, 5);
    ledger_.NoteEnqueued(book, 3);

    EXPECT_FALSE(ledger_.NoteConsumed(book, 5));
    EXPECT_TRUE(ledger_.NoteConsumed(book, 3));
    EXPECT_TRUE(book.IsEmpty());
    EXPECT_EQ(book.size, 0u);
}

TEST_F(OriginLedgerTest, DropClampsAtZero) {
    BookState& book = ledger_.GetOrCreate(origin_);
    ledger_.NoteEnqueued(book, 5);
    ledger_.NoteEnqueued(book, 3);

    EXPECT_FALSE(ledger_.NoteDropped(book, 1, 5));
    EXPECT_TRUE(ledger_.NoteDropped(book, 4, 100));
    EXPECT_EQ(book.message_count, 0u);
    EXPECT_EQ(book.size, 0u);
    EXPECT_FALSE(ledger_.NoteDropped(book, 1, 1));
}

TEST_F(OriginLedgerTest, EraseRemovesBook) {
    ledger_.GetOrCreate(origin_);
    ledger_.Erase(origin_);
    EXPECT_EQ(ledger_.Find(origin_), nullptr);
    EXPECT_EQ(ledger_.Size(), 0u);
}

TEST_F(OriginLedgerTest, PageCountFollowsWindow) {
    BookState book;
    book.begin = 3;
    book.end = 7;
    EXPECT_EQ(book.PageCount(), 4u);
}
