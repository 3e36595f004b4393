#include "event_bus.h"

namespace Wharf {

size_t EventBus::SubscriberCount(EventType event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = event_handlers_.find(event);
    return it == event_handlers_.end() ? 0 : it->second.size();
}

} // namespace Wharf
