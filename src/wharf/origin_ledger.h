#pragma once

#include <cstdint>
#include <optional>

#include "absl/container/node_hash_map.h"
#include "types.h"

namespace Wharf {

/**
 * Ring links of a book that currently has pending messages
 */
struct ReadyNeighbours {
    MessageOrigin prev;
    MessageOrigin next;
};

/**
 * Per-origin ledger. Pages [begin, end) are live; message_count and size
 * are the sums over those pages.
 */
struct BookState {
    PageIndex begin = 0;
    PageIndex end = 0;
    uint64_t message_count = 0;
    uint64_t size = 0;
    std::optional<ReadyNeighbours> ready_neighbours;

    uint64_t PageCount() const { return end - begin; }
    bool IsEmpty() const { return message_count == 0; }
};

/**
 * OriginLedger owns the book table. Transitions across zero are reported to
 * the caller, which keeps the ready ring in sync.
 */
class OriginLedger {
public:
    OriginLedger() = default;

    BookState& GetOrCreate(const MessageOrigin& origin);
    BookState* Find(const MessageOrigin& origin);
    const BookState* Find(const MessageOrigin& origin) const;

    // Returns true if the book went from empty to non-empty
    bool NoteEnqueued(BookState& book, uint64_t payload_size);

    // Returns true if the book became empty
    bool NoteConsumed(BookState& book, uint64_t payload_size);

    // Drops messages that left the queue without being consumed one by one
    // (quarantined pages). Returns true if the book became empty.
    bool NoteDropped(BookState& book, uint64_t messages, uint64_t size);

    void Erase(const MessageOrigin& origin);
    size_t Size() const { return books_.size(); }

    template <typename Fn>
    void ForEach(Fn&& fn) const {
        for (const auto& [origin, book] : books_) {
            fn(origin, book);
        }
    }

private:
    absl::node_hash_map<MessageOrigin, BookState> books_;
};

} // namespace Wharf
