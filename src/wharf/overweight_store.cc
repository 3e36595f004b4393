#include "overweight_store.h"

#include <algorithm>
#include <utility>
#include <glog/logging.h>

namespace Wharf {

OverweightHandle OverweightStore::Insert(const MessageOrigin& origin,
                                         std::string_view payload,
                                         std::string reason,
                                         std::optional<PageIndex> page_index,
                                         std::optional<uint32_t> message_index) {
    const OverweightHandle handle = next_handle_++;
    OverweightEntry entry;
    entry.handle = handle;
    entry.origin = origin;
    entry.payload = std::string(payload);
    entry.reason = std::move(reason);
    entry.page_index = page_index;
    entry.message_index = message_index;
    entries_.emplace(handle, std::move(entry));

    OriginTotals& totals = totals_[origin];
    totals.count += 1;
    totals.size += payload.size();
    return handle;
}

const OverweightEntry* OverweightStore::Find(OverweightHandle handle) const {
    auto it = entries_.find(handle);
    return it == entries_.end() ? nullptr : &it->second;
}

bool OverweightStore::Remove(OverweightHandle handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return false;
    }

    auto totals_it = totals_.find(it->second.origin);
    if (totals_it == totals_.end() || totals_it->second.count == 0) {
        LOG(ERROR) << "[OverweightStore] Totals missing for " << it->second.origin;
    } else {
        totals_it->second.count -= 1;
        totals_it->second.size -= std::min<uint64_t>(totals_it->second.size, it->second.payload.size());
        if (totals_it->second.count == 0) {
            totals_.erase(totals_it);
        }
    }
    entries_.erase(it);
    return true;
}

uint64_t OverweightStore::CountFor(const MessageOrigin& origin) const {
    auto it = totals_.find(origin);
    return it == totals_.end() ? 0 : it->second.count;
}

uint64_t OverweightStore::SizeFor(const MessageOrigin& origin) const {
    auto it = totals_.find(origin);
    return it == totals_.end() ? 0 : it->second.size;
}

} // namespace Wharf
