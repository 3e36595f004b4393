#include "origin_ledger.h"

#include <algorithm>
#include <glog/logging.h>

namespace Wharf {

BookState& OriginLedger::GetOrCreate(const MessageOrigin& origin) {
    auto [it, inserted] = books_.try_emplace(origin);
    if (inserted) {
        VLOG(2) << "[OriginLedger] New book for " << origin;
    }
    return it->second;
}

BookState* OriginLedger::Find(const MessageOrigin& origin) {
    auto it = books_.find(origin);
    return it == books_.end() ? nullptr : &it->second;
}

const BookState* OriginLedger::Find(const MessageOrigin& origin) const {
    auto it = books_.find(origin);
    return it == books_.end() ? nullptr : &it->second;
}

bool OriginLedger::NoteEnqueued(BookState& book, uint64_t payload_size) {
    const bool was_empty = book.IsEmpty();
    book.message_count += 1;
    book.size += payload_size;
    return was_empty;
}

bool OriginLedger::NoteConsumed(BookState& book, uint64_t payload_size) {
    CHECK_GT(book.message_count, 0u) << "Consumed a message from an empty book";
    book.message_count -= 1;
    book.size -= std::min(book.size, payload_size);
    return book.IsEmpty();
}

bool OriginLedger::NoteDropped(BookState& book, uint64_t messages, uint64_t size) {
    if (book.IsEmpty()) {
        return false;
    }
    if (messages > book.message_count || size > book.size) {
        LOG(ERROR) << "Dropping " << messages << " messages / " << size
                   << " bytes from a book holding " << book.message_count << " / " << book.size;
    }
    book.message_count -= std::min(book.message_count, messages);
    book.size -= std::min(book.size, size);
    return book.IsEmpty();
}

void OriginLedger::Erase(const MessageOrigin& origin) {
    books_.erase(origin);
}

} // namespace Wharf
