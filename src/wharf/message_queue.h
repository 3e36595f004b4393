#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "../common/configuration.h"
#include "event_bus.h"
#include "interfaces.h"
#include "origin_ledger.h"
#include "overweight_store.h"
#include "page_store.h"
#include "ready_ring.h"
#include "service_guard.h"
#include "types.h"
#include "weight_meter.h"

namespace Wharf {

/**
 * Queue policy, normally built from the loaded configuration
 */
struct QueueOptions {
    size_t heap_size = kDefaultPageHeapSize;
    // Must be set; a message failing temporarily more often than this is
    // parked as overweight
    uint32_t max_temporary_failures = 0;
    // Successes per origin turn; 0 drains the first page of the turn
    uint32_t max_messages_per_turn = kDefaultMaxMessagesPerTurn;
    // 0 disables parking of messages that ask for more than this
    Weight max_message_weight = 0;
    Weight service_weight = kDefaultServiceWeight;
    Weight idle_max_service_weight = kDefaultIdleMaxServiceWeight;

    static QueueOptions FromConfig(const WharfConfig& config);
};

/**
 * MessageQueue stores messages per origin in bounded pages and services them
 * round-robin under a weight budget.
 *
 * Single-threaded. Service, ExecuteOverweight and DiscardOverweight hold the
 * service guard for their whole run; calling any of them from inside the
 * handler fails with kRecursiveDisallowed. Enqueue and ParkOversized are
 * allowed from inside the handler.
 */
class MessageQueue {
public:
    using PausedQuery = std::function<bool(const MessageOrigin&)>;

    /**
     * Constructor
     *
     * @param options Queue policy; throws std::invalid_argument when invalid
     * @param handler Executes messages
     * @param weights Overhead weight table
     */
    MessageQueue(const QueueOptions& options,
                 std::shared_ptr<IMessageHandler> handler,
                 std::shared_ptr<IWeightInfo> weights);

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /**
     * Append a message to the origin's queue
     *
     * @return kTooLarge, with nothing stored, if the message exceeds the page
     *         heap bound; the caller may hand it to ParkOversized
     */
    QueueError Enqueue(const MessageOrigin& origin, std::string_view message);

    /**
     * Enqueue in order, stopping at the first rejected message
     *
     * @param accepted Set to the number of messages stored, if non-null
     */
    QueueError EnqueueMessages(const MessageOrigin& origin,
                               const std::vector<std::string>& messages,
                               size_t* accepted = nullptr);

    // Store a message rejected with kTooLarge in the overweight store
    OverweightHandle ParkOversized(const MessageOrigin& origin, std::string_view message);

    // Service ready origins until the budget, the ring or progress runs out
    ServiceReport Service(Weight weight_limit);

    // Service with the configured per-block budget
    ServiceReport ServiceBlock();

    // Service with what is left of a block, capped by the idle budget
    ServiceReport ServiceIdle(Weight remaining_weight);

    /**
     * Execute a parked message outside the ready ring
     *
     * @param handle Overweight handle
     * @param weight_limit Budget of this attempt, base cost included
     * @param weight_used Set to the weight charged
     * @return kNone if the handler succeeded and the entry was removed
     */
    QueueError ExecuteOverweight(OverweightHandle handle, Weight weight_limit, Weight& weight_used);

    // Drop a parked message without executing it
    QueueError DiscardOverweight(OverweightHandle handle);

    QueueFootprint Footprint(const MessageOrigin& origin) const;
    std::vector<MessageOrigin> ReadyOrigins() const { return ring_.Members(); }
    const OverweightEntry* FindOverweight(OverweightHandle handle) const { return overweight_.Find(handle); }
    size_t OverweightCount() const { return overweight_.Size(); }
    size_t QuarantinedPageCount() const { return pages_.QuarantinedCount(); }

    // Paused origins stay ready but are skipped by Service
    void SetPausedQuery(PausedQuery query) { paused_query_ = std::move(query); }

    // Every violated storage invariant, empty when consistent
    std::vector<std::string> CheckIntegrity() const;

    EventBus& events() { return events_; }
    const QueueOptions& options() const { return options_; }

    // Direct table access for storage migrations and tests; bypasses the
    // ledger and the ready ring
    PageStore& storage() { return pages_; }
    const PageStore& storage() const { return pages_; }

private:
    enum class ItemOutcome {
        kConsumed,
        kParked,
        kRetry,
        kInsufficientWeight,
        kBudgetTooSmall,
        kOutOfWeight,
        kQuarantined,
    };

    struct TurnResult {
        bool progress = false;
        bool stop = false;
        StopReason stop_reason = StopReason::kWeightExhausted;
    };

    // State of one Service() invocation
    struct ServiceContext {
        const ServiceToken& token;
        WeightMeter meter;
        ServiceReport report;
        bool attempted = false;
        absl::flat_hash_set<MessageOrigin> touched;
    };

    static const QueueOptions& Validated(const QueueOptions& options);

    StopReason RunServiceLoop(ServiceContext& ctx);
    TurnResult ServiceOrigin(ServiceContext& ctx, const MessageOrigin& origin);
    ItemOutcome ServiceFront(ServiceContext& ctx, const MessageOrigin& origin, PageIndex index);

    // Remove the front message of a page from normal flow. Only callable
    // while holding the service token.
    void ConsumeFront(const ServiceToken& token,
                      ServiceReport& report,
                      const MessageOrigin& origin,
                      PageIndex index);
    void ParkFront(const ServiceToken& token,
                   ServiceReport& report,
                   const MessageOrigin& origin,
                   PageIndex index,
                   uint32_t message_index,
                   const std::string& message,
                   std::string reason);
    void QuarantinePage(const ServiceToken& token,
                        ServiceReport& report,
                        const MessageOrigin& origin,
                        PageIndex index,
                        std::string diagnostic);
    void RetireBookIfEmpty(const MessageOrigin& origin);

    bool IsPaused(const MessageOrigin& origin) const;
    void NotifyQueueChanged(const MessageOrigin& origin);

    QueueOptions options_;
    std::shared_ptr<IMessageHandler> handler_;
    std::shared_ptr<IWeightInfo> weights_;

    OriginLedger ledger_;
    PageStore pages_;
    ReadyRing ring_;
    OverweightStore overweight_;
    ServiceGuard guard_;
    EventBus events_;
    PausedQuery paused_query_;
};

} // namespace Wharf
