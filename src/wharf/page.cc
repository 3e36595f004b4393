#include "page.h"
#include "../common/wire_formats.h"

#include <utility>

#include <absl/strings/str_cat.h>

namespace Wharf {

bool DecodeHeap(std::string_view heap, size_t offset, std::vector<std::string>* out) {
    while (offset < heap.size()) {
        std::string_view payload;
        if (!wire::DecodeItem(heap, offset, payload)) {
            return false;
        }
        out->emplace_back(payload);
        offset += wire::ItemFootprint(payload.size());
    }
    return offset == heap.size();
}

Page Page::FromParts(std::string heap,
                     uint32_t first,
                     uint32_t first_index,
                     uint32_t remaining,
                     uint64_t remaining_size) {
    Page page;
    page.heap_ = std::move(heap);
    page.first_ = first;
    page.first_index_ = first_index;
    page.remaining_ = remaining;
    page.remaining_size_ = remaining_size;
    return page;
}

bool Page::HasRoomFor(size_t payload_size, size_t heap_size) const {
    const size_t needed = wire::ItemFootprint(payload_size);
    return heap_.size() <= heap_size && needed <= heap_size - heap_.size();
}

void Page::Append(std::string_view payload) {
    wire::AppendItem(heap_, payload);
    remaining_ += 1;
    remaining_size_ += payload.size();
}

bool Page::PeekFront(std::string_view& payload) const {
    if (remaining_ == 0) {
        return false;
    }
    return wire::DecodeItem(heap_, first_, payload);
}

bool Page::ConsumeFront(size_t& payload_size) {
    std::string_view payload;
    if (!PeekFront(payload) || payload.size() > remaining_size_) {
        return false;
    }
    payload_size = payload.size();
    first_ += static_cast<uint32_t>(wire::ItemFootprint(payload_size));
    first_index_ += 1;
    remaining_ -= 1;
    remaining_size_ -= payload_size;
    front_retries_ = 0;
    return true;
}

bool Page::Validate(std::string* diagnostic) const {
    if (first_ > heap_.size()) {
        if (diagnostic) {
            *diagnostic = absl::StrCat("first offset ", first_, " past heap end ", heap_.size());
        }
        return false;
    }

    uint64_t count = 0;
    uint64_t size = 0;
    size_t offset = first_;
    while (offset < heap_.size()) {
        std::string_view payload;
        if (!wire::DecodeItem(heap_, offset, payload)) {
            if (diagnostic) {
                *diagnostic = absl::StrCat("truncated item at offset ", offset,
                                           " of heap size ", heap_.size());
            }
            return false;
        }
        ++count;
        size += payload.size();
        offset += wire::ItemFootprint(payload.size());
    }

    if (count != remaining_ || size != remaining_size_) {
        if (diagnostic) {
            *diagnostic = absl::StrCat("recorded ", remaining_, " messages / ", remaining_size_,
                                       " bytes but heap holds ", count, " / ", size);
        }
        return false;
    }
    return true;
}

std::vector<std::string> Page::Messages() const {
    std::vector<std::string> out;
    out.reserve(remaining_);
    DecodeHeap(heap_, first_, &out);
    return out;
}

} // namespace Wharf
