#include <gtest/gtest.h>
#include "../../src/wharf/page_store.h"
#include "../../src/common/wire_formats.h"

using namespace Wharf;

class PageStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<PageStore>(15);
    }

    PageIndex Append(BookState& book, std::string_view payload) {
        PageIndex index = 0;
        EXPECT_EQ(store_->Append(origin_, book, payload, index), QueueError::kNone);
        book.message_count += 1;
        book.size += payload.size();
        return index;
    }

    const MessageOrigin origin_ = MessageOrigin::Sibling(7);
    std::unique_ptr<PageStore> store_;
};

TEST_F(PageStoreTest, SmallHeapPutsOneMessagePerPage) {
    BookState book;
    EXPECT_EQ(Append(book, "0123456789"), 0u);
    EXPECT_EQ(Append(book, "abcdefghij"), 1u);

    EXPECT_EQ(book.begin, 0u);
    EXPECT_EQ(book.end, 2u);
    EXPECT_EQ(store_->PageCount(), 2u);
    ASSERT_NE(store_->Get(origin_, 0), nullptr);
    EXPECT_EQ(store_->Get(origin_, 0)->remaining(), 1u);
}

TEST_F(PageStoreTest, SmallMessagesShareAPage) {
    BookState book;
    EXPECT_EQ(Append(book, "ab"), 0u);
    EXPECT_EQ(Append(book, "cd"), 0u);
    // 12 bytes used, a third 2 byte item needs 6
    EXPECT_EQ(Append(book, "ef"), 1u);
    EXPECT_EQ(store_->Get(origin_, 0)->remaining(), 2u);
}

TEST_F(PageStoreTest, RejectsMessageLargerThanHeap) {
    BookState book;
    PageIndex index = 0;
    EXPECT_FALSE(store_->Admits(12));
    EXPECT_TRUE(store_->Admits(11));
    EXPECT_EQ(store_->Append(origin_, book, std::string(12, 'x'), index), QueueError::kTooLarge);
    EXPECT_EQ(book.end, 0u);
    EXPECT_EQ(store_->PageCount(), 0u);
}

TEST_F(PageStoreTest, DrainedPageIsReapedAndWindowAdvances) {
    BookState book;
    Append(book, "first");
    Append(book, "second");

    std::string_view front;
    ASSERT_TRUE(store_->PeekFront(origin_, 0, front));
    EXPECT_EQ(front, "first");

    PageStore::ConsumeResult result;
    ASSERT_TRUE(store_->MarkConsumed(origin_, book, 0, result));
    EXPECT_EQ(result.payload_size, 5u);
    EXPECT_TRUE(result.reaped);
    EXPECT_EQ(book.begin, 1u);
    EXPECT_EQ(store_->Get(origin_, 0), nullptr);

    ASSERT_TRUE(store_->MarkConsumed(origin_, book, 1, result));
    EXPECT_TRUE(result.reaped);
    EXPECT_EQ(book.begin, 2u);
    EXPECT_EQ(book.end, 2u);
    EXPECT_EQ(store_->PageCount(), 0u);
}

TEST_F(PageStoreTest, ConsumeFromMissingPageFails) {
    BookState book;
    PageStore::ConsumeResult result;
    EXPECT_FALSE(store_->MarkConsumed(origin_, book, 3, result));
}

TEST_F(PageStoreTest, QuarantineKeepsPageAndMovesWindow) {
    BookState book;
    Append(book, "first");
    Append(book, "second");

    store_->Quarantine(origin_, book, 0, "bad counters");
    EXPECT_EQ(store_->Get(origin_, 0), nullptr);
    EXPECT_EQ(book.begin, 1u);
    ASSERT_EQ(store_->QuarantinedCount(), 1u);

    const QuarantinedPage* held = store_->FindQuarantined(origin_, 0);
    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->diagnostic, "bad counters");
    EXPECT_EQ(held->page.Messages(), (std::vector<std::string>{"first"}));
    EXPECT_EQ(store_->FindQuarantined(origin_, 1), nullptr);
}

TEST_F(PageStoreTest, QuarantineOfMissingPageRecordsEmptyPage) {
    BookState book;
    Append(book, "first");
    book.end = 3;

    store_->Quarantine(origin_, book, 1, "missing");
    const QuarantinedPage* held = store_->FindQuarantined(origin_, 1);
    ASSERT_NE(held, nullptr);
    EXPECT_TRUE(held->page.heap().empty());
    // page 0 is still live, so the window does not move
    EXPECT_EQ(book.begin, 0u);
}

TEST_F(PageStoreTest, PutReplacesStoredPage) {
    BookState book;
    Append(book, "first");

    std::string heap;
    wire::AppendItem(heap, "other");
    store_->Put(origin_, 0, Page::FromParts(heap, 0, 0, 1, 5));

    std::string_view front;
    ASSERT_TRUE(store_->PeekFront(origin_, 0, front));
    EXPECT_EQ(front, "other");
}

TEST_F(PageStoreTest, OriginsDoNotShareKeys) {
    BookState book;
    BookState other_book;
    Append(book, "mine");
    PageIndex index = 0;
    ASSERT_EQ(store_->Append(MessageOrigin::Parent(), other_book, "theirs", index), QueueError::kNone);

    EXPECT_EQ(index, 0u);
    EXPECT_EQ(store_->PageCount(), 2u);
    std::string_view front;
    ASSERT_TRUE(store_->PeekFront(MessageOrigin::Parent(), 0, front));
    EXPECT_EQ(front, "theirs");
}
