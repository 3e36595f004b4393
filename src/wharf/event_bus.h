#pragma once

#include <any>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.h"

namespace Wharf {

// Event payloads

struct MessageProcessedEvent {
    MessageOrigin origin;
    PageIndex page_index = 0;
    uint32_t message_index = 0;
    Weight weight_used = 0;
};

struct ProcessingFailedEvent {
    MessageOrigin origin;
    PageIndex page_index = 0;
    uint32_t message_index = 0;
    std::string reason;
    uint32_t attempts = 0;
};

struct MessageOverweightEvent {
    MessageOrigin origin;
    OverweightHandle handle = 0;
    std::string reason;
};

struct OverweightExecutedEvent {
    OverweightHandle handle = 0;
    bool success = false;
    Weight weight_used = 0;
};

struct OverweightDiscardedEvent {
    OverweightHandle handle = 0;
};

struct PageReapedEvent {
    MessageOrigin origin;
    PageIndex page_index = 0;
};

struct PageQuarantinedEvent {
    MessageOrigin origin;
    PageIndex page_index = 0;
    std::string diagnostic;
};

struct QueueChangedEvent {
    MessageOrigin origin;
    QueueFootprint footprint;
};

/**
 * Typed publish-subscribe for queue events. Handlers run synchronously on
 * the publishing thread, outside the bus lock.
 */
class EventBus {
public:
    enum class EventType {
        MESSAGE_PROCESSED,
        PROCESSING_FAILED,
        MESSAGE_OVERWEIGHT,
        OVERWEIGHT_EXECUTED,
        OVERWEIGHT_DISCARDED,
        PAGE_REAPED,
        PAGE_QUARANTINED,
        QUEUE_CHANGED
    };

    EventBus() = default;
    ~EventBus() = default;

    // Event subscription
    template<typename EventData>
    void Subscribe(EventType event, std::function<void(const EventData&)> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        event_handlers_[event].emplace_back(
            [handler](const std::any& data) {
                handler(std::any_cast<const EventData&>(data));
            }
        );
    }

    // Event publishing
    template<typename EventData>
    void Publish(EventType event, const EventData& data) {
        std::vector<std::function<void(const std::any&)>> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = event_handlers_.find(event);
            if (it == event_handlers_.end()) {
                return;
            }
            handlers = it->second;
        }
        const std::any payload(data);
        for (const auto& handler : handlers) {
            handler(payload);
        }
    }

    size_t SubscriberCount(EventType event) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<EventType, std::vector<std::function<void(const std::any&)>>> event_handlers_;
};

} // namespace Wharf
