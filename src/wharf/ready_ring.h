#pragma once

#include <optional>
#include <vector>

#include "origin_ledger.h"
#include "types.h"

namespace Wharf {

/**
 * ReadyRing is a circular doubly-linked list over the books that hold
 * pending messages. Links live in BookState::ready_neighbours and name
 * origins, so the ring owns nothing but its head.
 */
class ReadyRing {
public:
    explicit ReadyRing(OriginLedger& ledger) : ledger_(ledger) {}

    // Insert before the head, i.e. at the tail of the current pass.
    // No-op if the origin is already linked.
    void Link(const MessageOrigin& origin);

    // Remove the origin; the head moves to its successor if it was the head
    void Unlink(const MessageOrigin& origin);

    // Rotate the head to head.next and return the new head
    std::optional<MessageOrigin> Advance();

    std::optional<MessageOrigin> Head() const { return head_; }
    size_t Size() const { return size_; }
    bool Empty() const { return size_ == 0; }
    bool Contains(const MessageOrigin& origin) const;

    // Members in service order starting at the head
    std::vector<MessageOrigin> Members() const;

private:
    BookState& BookOf(const MessageOrigin& origin);
    const BookState& BookOf(const MessageOrigin& origin) const;

    OriginLedger& ledger_;
    std::optional<MessageOrigin> head_;
    size_t size_ = 0;
};

} // namespace Wharf
