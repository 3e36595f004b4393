#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "absl/container/node_hash_map.h"
#include "origin_ledger.h"
#include "page.h"
#include "types.h"

namespace Wharf {

/**
 * A page pulled out of service because its counters disagree with its heap
 */
struct QuarantinedPage {
    MessageOrigin origin;
    PageIndex index = 0;
    Page page;
    std::string diagnostic;
};

/**
 * PageStore owns the page table keyed by (origin, page index) and keeps each
 * book's [begin, end) window in step with the pages it holds.
 */
class PageStore {
public:
    struct ConsumeResult {
        size_t payload_size = 0;
        bool reaped = false;
    };

    explicit PageStore(size_t heap_size);

    /**
     * Append a message to the origin's current page, opening a new page at
     * index book.end when the current one has no room
     *
     * @param origin Owner of the book
     * @param book Book of origin; its window grows when a page is opened
     * @param payload Message bytes
     * @param index Set to the page the message landed in
     * @return kTooLarge if the message can never fit a page, kNone otherwise
     */
    QueueError Append(const MessageOrigin& origin,
                      BookState& book,
                      std::string_view payload,
                      PageIndex& index);

    // Whether a payload of this size fits an empty page
    bool Admits(size_t payload_size) const;

    const Page* Get(const MessageOrigin& origin, PageIndex index) const;
    Page* GetMutable(const MessageOrigin& origin, PageIndex index);

    // Raw table write, replacing whatever is stored under the key
    void Put(const MessageOrigin& origin, PageIndex index, Page page);

    bool PeekFront(const MessageOrigin& origin, PageIndex index, std::string_view& payload) const;

    /**
     * Consume the front message of a page; a drained page is reaped and the
     * book's window moves past it
     *
     * @return false if the page is missing or its front item is unreadable
     */
    bool MarkConsumed(const MessageOrigin& origin,
                      BookState& book,
                      PageIndex index,
                      ConsumeResult& result);

    // Move a page out of the table and the book's window. A page missing
    // from the table is recorded with an empty heap.
    void Quarantine(const MessageOrigin& origin,
                    BookState& book,
                    PageIndex index,
                    std::string diagnostic);

    const QuarantinedPage* FindQuarantined(const MessageOrigin& origin, PageIndex index) const;
    const std::vector<QuarantinedPage>& quarantined() const { return quarantined_; }

    size_t PageCount() const { return pages_.size(); }
    size_t QuarantinedCount() const { return quarantined_.size(); }
    size_t heap_size() const { return heap_size_; }

    template <typename Fn>
    void ForEach(Fn&& fn) const {
        for (const auto& [key, page] : pages_) {
            fn(key, page);
        }
    }

private:
    void Remove(const MessageOrigin& origin, BookState& book, PageIndex index);

    size_t heap_size_;
    absl::node_hash_map<PageKey, Page> pages_;
    // Page indices restart when an emptied book is erased, so quarantined
    // pages are kept in arrival order rather than keyed
    std::vector<QuarantinedPage> quarantined_;
};

} // namespace Wharf
