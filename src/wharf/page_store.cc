#include "page_store.h"
#include "../common/wire_formats.h"

#include <utility>
#include <glog/logging.h>

namespace Wharf {

PageStore::PageStore(size_t heap_size)
    : heap_size_(heap_size) {
    CHECK_GE(heap_size_, wire::MIN_PAGE_HEAP_SIZE) << "Page heap cannot hold any message";
    CHECK_LE(heap_size_, wire::MAX_PAGE_HEAP_SIZE) << "Page heap exceeds 32-bit offsets";
}

bool PageStore::Admits(size_t payload_size) const {
    return wire::FitsInEmptyPage(payload_size, heap_size_);
}

QueueError PageStore::Append(const MessageOrigin& origin,
                             BookState& book,
                             std::string_view payload,
                             PageIndex& index) {
    if (!Admits(payload.size())) {
        VLOG(1) << "[PageStore] " << origin << ": message of " << payload.size()
                << " bytes exceeds page heap of " << heap_size_;
        return QueueError::kTooLarge;
    }

    if (book.end > book.begin) {
        Page* current = GetMutable(origin, book.end - 1);
        if (current && current->HasRoomFor(payload.size(), heap_size_)) {
            current->Append(payload);
            index = book.end - 1;
            return QueueError::kNone;
        }
    }

    index = book.end;
    Page page;
    page.Append(payload);
    pages_.insert_or_assign(PageKey{origin, index}, std::move(page));
    book.end += 1;
    VLOG(2) << "[PageStore] " << origin << ": opened page " << index;
    return QueueError::kNone;
}

const Page* PageStore::Get(const MessageOrigin& origin, PageIndex index) const {
    auto it = pages_.find(PageKey{origin, index});
    return it == pages_.end() ? nullptr : &it->second;
}

Page* PageStore::GetMutable(const MessageOrigin& origin, PageIndex index) {
    auto it = pages_.find(PageKey{origin, index});
    return it == pages_.end() ? nullptr : &it->second;
}

void PageStore::Put(const MessageOrigin& origin, PageIndex index, Page page) {
    pages_.insert_or_assign(PageKey{origin, index}, std::move(page));
}

bool PageStore::PeekFront(const MessageOrigin& origin, PageIndex index, std::string_view& payload) const {
    const Page* page = Get(origin, index);
    return page != nullptr && page->PeekFront(payload);
}

bool PageStore::MarkConsumed(const MessageOrigin& origin,
                             BookState& book,
                             PageIndex index,
                             ConsumeResult& result) {
    Page* page = GetMutable(origin, index);
    if (!page) {
        LOG(ERROR) << "[PageStore] " << origin << ": no page " << index << " to consume from";
        return false;
    }
    if (!page->ConsumeFront(result.payload_size)) {
        return false;
    }
    result.reaped = page->IsDrained();
    if (result.reaped) {
        Remove(origin, book, index);
        VLOG(2) << "[PageStore] " << origin << ": reaped page " << index;
    }
    return true;
}

void PageStore::Quarantine(const MessageOrigin& origin,
                           BookState& book,
                           PageIndex index,
                           std::string diagnostic) {
    LOG(ERROR) << "[PageStore] Quarantining page " << index << " of " << origin << ": " << diagnostic;
    QuarantinedPage entry{origin, index, Page(), std::move(diagnostic)};
    auto it = pages_.find(PageKey{origin, index});
    if (it != pages_.end()) {
        entry.page = std::move(it->second);
    }
    quarantined_.push_back(std::move(entry));
    Remove(origin, book, index);
}

const QuarantinedPage* PageStore::FindQuarantined(const MessageOrigin& origin, PageIndex index) const {
    for (auto it = quarantined_.rbegin(); it != quarantined_.rend(); ++it) {
        if (it->origin == origin && it->index == index) {
            return &*it;
        }
    }
    return nullptr;
}

void PageStore::Remove(const MessageOrigin& origin, BookState& book, PageIndex index) {
    pages_.erase(PageKey{origin, index});
    // Pages drain front to back, so the window only ever shrinks at begin
    while (book.begin < book.end && Get(origin, book.begin) == nullptr) {
        book.begin += 1;
    }
}

} // namespace Wharf
