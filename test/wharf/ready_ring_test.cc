#include <gtest/gtest.h>
#include "../../src/wharf/ready_ring.h"

using namespace Wharf;

class ReadyRingTest : public ::testing::Test {
protected:
    void SetUp() override {
        ring_ = std::make_unique<ReadyRing>(ledger_);
    }

    MessageOrigin AddBook(uint32_t id) {
        const MessageOrigin origin = MessageOrigin::Sibling(id);
        ledger_.GetOrCreate(origin);
        return origin;
    }

    OriginLedger ledger_;
    std::unique_ptr<ReadyRing> ring_;
};

TEST_F(ReadyRingTest, StartsEmpty) {
    EXPECT_TRUE(ring_->Empty());
    EXPECT_FALSE(ring_->Head().has_value());
    EXPECT_FALSE(ring_->Advance().has_value());
    EXPECT_TRUE(ring_->Members().empty());
}

TEST_F(ReadyRingTest, SoleMemberLinksToItself) {
    const MessageOrigin a = AddBook(1);
    ring_->Link(a);

    EXPECT_EQ(ring_->Size(), 1u);
    EXPECT_EQ(ring_->Head(), a);
    const BookState* book = ledger_.Find(a);
    ASSERT_TRUE(book->ready_neighbours.has_value());
    EXPECT_EQ(book->ready_neighbours->prev, a);
    EXPECT_EQ(book->ready_neighbours->next, a);
    EXPECT_EQ(ring_->Advance(), a);

    ring_->Unlink(a);
    EXPECT_TRUE(ring_->Empty());
    EXPECT_FALSE(ring_->Head().has_value());
    EXPECT_FALSE(ledger_.Find(a)->ready_neighbours.has_value());
}

TEST_F(ReadyRingTest, LinkAppendsAtTail) {
    const MessageOrigin a = AddBook(1);
    const MessageOrigin b = AddBook(2);
    const MessageOrigin c = AddBook(3);
    ring_->Link(a);
    ring_->Link(b);
    ring_->Link(c);

    EXPECT_EQ(ring_->Members(), (std::vector<MessageOrigin>{a, b, c}));
    EXPECT_EQ(ledger_.Find(a)->ready_neighbours->prev, c);
    EXPECT_EQ(ledger_.Find(c)->ready_neighbours->next, a);
}

TEST_F(ReadyRingTest, LinkIsIdempotent) {
    const MessageOrigin a = AddBook(1);
    const MessageOrigin b = AddBook(2);
    ring_->Link(a);
    ring_->Link(b);
    ring_->Link(a);

    EXPECT_EQ(ring_->Size(), 2u);
    EXPECT_EQ(ring_->Members(), (std::vector<MessageOrigin>{a, b}));
}

TEST_F(ReadyRingTest, AdvanceRotates) {
    const MessageOrigin a = AddBook(1);
    const MessageOrigin b = AddBook(2);
    const MessageOrigin c = AddBook(3);
    ring_->Link(a);
    ring_->Link(b);
    ring_->Link(c);

    EXPECT_EQ(ring_->Advance(), b);
    EXPECT_EQ(ring_->Advance(), c);
    EXPECT_EQ(ring_->Advance(), a);

    // After a rotation a new member still lands just before the head
    ring_->Advance();
    const MessageOrigin d = AddBook(4);
    ring_->Link(d);
    EXPECT_EQ(ring_->Members(), (std::vector<MessageOrigin>{b, c, a, d}));
}

TEST_F(ReadyRingTest, UnlinkHeadMovesToSuccessor) {
    const MessageOrigin a = AddBook(1);
    const MessageOrigin b = AddBook(2);
    const MessageOrigin c = AddBook(3);
    ring_->Link(a);
    ring_->Link(b);
    ring_->Link(c);

    ring_->Unlink(a);
    EXPECT_EQ(ring_->Head(), b);
    EXPECT_EQ(ring_->Members(), (std::vector<MessageOrigin>{b, c}));
    EXPECT_FALSE(ring_->Contains(a));

    ring_->Unlink(c);
    EXPECT_EQ(ring_->Head(), b);
    EXPECT_EQ(ledger_.Find(b)->ready_neighbours->next, b);
    EXPECT_EQ(ledger_.Find(b)->ready_neighbours->prev, b);
}

TEST_F(ReadyRingTest, UnlinkMiddleKeepsHead) {
    const MessageOrigin a = AddBook(1);
    const MessageOrigin b = AddBook(2);
    const MessageOrigin c = AddBook(3);
    ring_->Link(a);
    ring_->Link(b);
    ring_->Link(c);

    ring_->Unlink(b);
    EXPECT_EQ(ring_->Head(), a);
    EXPECT_EQ(ring_->Members(), (std::vector<MessageOrigin>{a, c}));

    // Unlinking twice is harmless
    ring_->Unlink(b);
    EXPECT_EQ(ring_->Size(), 2u);
}
