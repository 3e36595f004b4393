#include "ready_ring.h"

#include <glog/logging.h>

namespace Wharf {

BookState& ReadyRing::BookOf(const MessageOrigin& origin) {
    BookState* book = ledger_.Find(origin);
    CHECK(book != nullptr) << "Ready ring references " << origin << " without a book";
    return *book;
}

const BookState& ReadyRing::BookOf(const MessageOrigin& origin) const {
    const BookState* book = ledger_.Find(origin);
    CHECK(book != nullptr) << "Ready ring references " << origin << " without a book";
    return *book;
}

void ReadyRing::Link(const MessageOrigin& origin) {
    BookState& book = BookOf(origin);
    if (book.ready_neighbours.has_value()) {
        return;
    }

    if (!head_.has_value()) {
        book.ready_neighbours = ReadyNeighbours{origin, origin};
        head_ = origin;
        size_ = 1;
        VLOG(3) << "[ReadyRing] " << origin << " is the sole ready origin";
        return;
    }

    const MessageOrigin head = *head_;
    BookState& head_book = BookOf(head);
    const MessageOrigin tail = head_book.ready_neighbours->prev;

    book.ready_neighbours = ReadyNeighbours{tail, head};
    head_book.ready_neighbours->prev = origin;
    // tail may be the head itself when the ring had one member
    BookOf(tail).ready_neighbours->next = origin;
    size_ += 1;
    VLOG(3) << "[ReadyRing] Linked " << origin << " after " << tail;
}

void ReadyRing::Unlink(const MessageOrigin& origin) {
    BookState& book = BookOf(origin);
    if (!book.ready_neighbours.has_value()) {
        return;
    }
    const ReadyNeighbours links = *book.ready_neighbours;
    book.ready_neighbours.reset();
    size_ -= 1;

    if (links.next == origin) {
        CHECK(head_.has_value() && *head_ == origin) << "Sole ready origin is not the head";
        head_.reset();
        VLOG(3) << "[ReadyRing] Unlinked " << origin << ", ring is empty";
        return;
    }

    BookOf(links.prev).ready_neighbours->next = links.next;
    BookOf(links.next).ready_neighbours->prev = links.prev;
    if (head_.has_value() && *head_ == origin) {
        head_ = links.next;
    }
    VLOG(3) << "[ReadyRing] Unlinked " << origin;
}

std::optional<MessageOrigin> ReadyRing::Advance() {
    if (!head_.has_value()) {
        return std::nullopt;
    }
    head_ = BookOf(*head_).ready_neighbours->next;
    return head_;
}

bool ReadyRing::Contains(const MessageOrigin& origin) const {
    const BookState* book = ledger_.Find(origin);
    return book != nullptr && book->ready_neighbours.has_value();
}

std::vector<MessageOrigin> ReadyRing::Members() const {
    std::vector<MessageOrigin> members;
    if (!head_.has_value()) {
        return members;
    }
    members.reserve(size_);
    MessageOrigin cursor = *head_;
    do {
        members.push_back(cursor);
        cursor = BookOf(cursor).ready_neighbours->next;
    } while (cursor != *head_ && members.size() <= size_);
    return members;
}

} // namespace Wharf
