#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * Page heap encoding shared by the page store and anything that inspects
 * stored pages. A heap is a plain concatenation of items, each one a 4-byte
 * little-endian payload length followed by the payload bytes.
 */

namespace Wharf {
namespace wire {

// ============================================================================
// Configuration constants (bounds for validation)
// ============================================================================

static constexpr size_t ITEM_HEADER_SIZE = sizeof(uint32_t);
static constexpr size_t MAX_PAGE_HEAP_SIZE = UINT32_MAX;  // offsets are u32
static constexpr size_t MIN_PAGE_HEAP_SIZE = ITEM_HEADER_SIZE + 1;

// ============================================================================
// Helper functions for item size calculations
// ============================================================================

/**
 * @brief Bytes an item occupies in a page heap
 * @param payload_size Payload bytes
 * @return Header plus payload
 */
inline constexpr size_t ItemFootprint(size_t payload_size) {
    return ITEM_HEADER_SIZE + payload_size;
}

/**
 * @brief Whether a payload can ever be stored in a page of the given bound
 */
inline constexpr bool FitsInEmptyPage(size_t payload_size, size_t heap_size) {
    return payload_size <= heap_size && ItemFootprint(payload_size) <= heap_size;
}

// ============================================================================
// Item header codec
// ============================================================================

inline void AppendItem(std::string& heap, std::string_view payload) {
    const uint32_t len = static_cast<uint32_t>(payload.size());
    char header[ITEM_HEADER_SIZE];
    header[0] = static_cast<char>(len & 0xff);
    header[1] = static_cast<char>((len >> 8) & 0xff);
    header[2] = static_cast<char>((len >> 16) & 0xff);
    header[3] = static_cast<char>((len >> 24) & 0xff);
    heap.append(header, ITEM_HEADER_SIZE);
    heap.append(payload.data(), payload.size());
}

/**
 * @brief Decode the item starting at offset
 * @param heap Page heap
 * @param offset Start of the item header
 * @param payload Set to a view into heap on success
 * @return false if the header or payload runs past the end of the heap
 */
inline bool DecodeItem(std::string_view heap, size_t offset, std::string_view& payload) {
    if (offset > heap.size() || heap.size() - offset < ITEM_HEADER_SIZE) {
        return false;
    }
    const auto* p = reinterpret_cast<const unsigned char*>(heap.data() + offset);
    const uint32_t len = static_cast<uint32_t>(p[0]) |
                         (static_cast<uint32_t>(p[1]) << 8) |
                         (static_cast<uint32_t>(p[2]) << 16) |
                         (static_cast<uint32_t>(p[3]) << 24);
    const size_t body = offset + ITEM_HEADER_SIZE;
    if (heap.size() - body < len) {
        return false;
    }
    payload = heap.substr(body, len);
    return true;
}

}  // namespace wire
}  // namespace Wharf
