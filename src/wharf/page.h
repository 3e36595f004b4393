#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Wharf {

/**
 * Decode every item of a heap from offset to the end
 *
 * @param heap Encoded page heap
 * @param offset Offset of the first item to decode
 * @param out Receives the payloads in stored order
 * @return false if an item is truncated; out holds the items decoded so far
 */
bool DecodeHeap(std::string_view heap, size_t offset, std::vector<std::string>* out);

/**
 * A bounded run of one origin's messages. Items are appended at the end of
 * the heap and consumed from first; consumed bytes stay in the heap until the
 * page is reaped.
 */
class Page {
public:
    Page() = default;

    // Rebuild a page from its stored fields
    static Page FromParts(std::string heap,
                          uint32_t first,
                          uint32_t first_index,
                          uint32_t remaining,
                          uint64_t remaining_size);

    bool HasRoomFor(size_t payload_size, size_t heap_size) const;
    void Append(std::string_view payload);

    // View of the next unconsumed payload; false if drained or truncated.
    // The view is invalidated by the next Append.
    bool PeekFront(std::string_view& payload) const;

    // Drop the front item; false (and no change) if it cannot be decoded
    bool ConsumeFront(size_t& payload_size);

    // Consecutive temporary failures of the current front item
    uint32_t NoteTemporaryFailure() { return ++front_retries_; }
    uint32_t front_retries() const { return front_retries_; }

    // Recorded counters must describe exactly the undrained part of the heap
    bool Validate(std::string* diagnostic) const;

    // Undrained messages, oldest first
    std::vector<std::string> Messages() const;

    bool IsDrained() const { return remaining_ == 0; }

    const std::string& heap() const { return heap_; }
    uint32_t first() const { return first_; }
    uint32_t first_index() const { return first_index_; }
    uint32_t remaining() const { return remaining_; }
    uint64_t remaining_size() const { return remaining_size_; }

private:
    std::string heap_;
    uint32_t first_ = 0;          // offset of the first unconsumed item
    uint32_t first_index_ = 0;    // number of items already consumed
    uint32_t remaining_ = 0;      // unconsumed items
    uint64_t remaining_size_ = 0; // unconsumed payload bytes, headers excluded
    uint32_t front_retries_ = 0;
};

} // namespace Wharf
