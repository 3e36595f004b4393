#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "absl/container/node_hash_map.h"
#include "types.h"

namespace Wharf {

/**
 * A message parked outside normal service
 */
struct OverweightEntry {
    OverweightHandle handle = 0;
    MessageOrigin origin;
    std::string payload;
    std::string reason;
    // Where the message sat before it was parked; empty for messages that
    // were rejected at enqueue time
    std::optional<PageIndex> page_index;
    std::optional<uint32_t> message_index;
};

/**
 * OverweightStore keeps parked messages under handles that are never
 * reused, plus per-origin totals for footprint queries.
 */
class OverweightStore {
public:
    OverweightStore() = default;

    OverweightHandle Insert(const MessageOrigin& origin,
                            std::string_view payload,
                            std::string reason,
                            std::optional<PageIndex> page_index = std::nullopt,
                            std::optional<uint32_t> message_index = std::nullopt);

    const OverweightEntry* Find(OverweightHandle handle) const;

    // Returns false if the handle is unknown
    bool Remove(OverweightHandle handle);

    size_t Size() const { return entries_.size(); }
    uint64_t CountFor(const MessageOrigin& origin) const;
    uint64_t SizeFor(const MessageOrigin& origin) const;
    OverweightHandle next_handle() const { return next_handle_; }

    template <typename Fn>
    void ForEach(Fn&& fn) const {
        for (const auto& [handle, entry] : entries_) {
            fn(entry);
        }
    }

private:
    struct OriginTotals {
        uint64_t count = 0;
        uint64_t size = 0;
    };

    OverweightHandle next_handle_ = 0;
    absl::node_hash_map<OverweightHandle, OverweightEntry> entries_;
    absl::flat_hash_map<MessageOrigin, OriginTotals> totals_;
};

} // namespace Wharf
