#include "message_queue.h"
#include "../common/wire_formats.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

namespace Wharf {

QueueOptions QueueOptions::FromConfig(const WharfConfig& config) {
    QueueOptions options;
    options.heap_size = config.queue.heap_size.get();
    options.max_temporary_failures = static_cast<uint32_t>(std::max(0, config.queue.max_temporary_failures.get()));
    options.max_messages_per_turn = static_cast<uint32_t>(std::max(0, config.queue.max_messages_per_turn.get()));
    options.max_message_weight = config.queue.max_message_weight.get();
    options.service_weight = config.service.service_weight.get();
    options.idle_max_service_weight = config.service.idle_max_service_weight.get();
    return options;
}

const QueueOptions& MessageQueue::Validated(const QueueOptions& options) {
    if (options.max_temporary_failures == 0) {
        throw std::invalid_argument("max_temporary_failures must be configured (>= 1)");
    }
    if (options.heap_size < wire::MIN_PAGE_HEAP_SIZE || options.heap_size > wire::MAX_PAGE_HEAP_SIZE) {
        throw std::invalid_argument("heap_size out of range: " + std::to_string(options.heap_size));
    }
    return options;
}

MessageQueue::MessageQueue(const QueueOptions& options,
                           std::shared_ptr<IMessageHandler> handler,
                           std::shared_ptr<IWeightInfo> weights)
    : options_(Validated(options)),
      handler_(std::move(handler)),
      weights_(std::move(weights)),
      pages_(options_.heap_size),
      ring_(ledger_) {
    if (!handler_ || !weights_) {
        throw std::invalid_argument("MessageQueue needs a message handler and a weight table");
    }
    VLOG(1) << "[MessageQueue] heap_size=" << options_.heap_size
            << " max_temporary_failures=" << options_.max_temporary_failures
            << " max_messages_per_turn=" << options_.max_messages_per_turn;
}

// ============================================================================
// Enqueue path
// ============================================================================

QueueError MessageQueue::Enqueue(const MessageOrigin& origin, std::string_view message) {
    if (!pages_.Admits(message.size())) {
        VLOG(1) << "[MessageQueue] Rejecting " << message.size() << " byte message from "
                << origin << ": exceeds page heap of " << options_.heap_size;
        return QueueError::kTooLarge;
    }

    BookState& book = ledger_.GetOrCreate(origin);
    PageIndex index = 0;
    QueueError err = pages_.Append(origin, book, message, index);
    if (err != QueueError::kNone) {
        RetireBookIfEmpty(origin);
        return err;
    }

    if (ledger_.NoteEnqueued(book, message.size())) {
        ring_.Link(origin);
    }
    VLOG(3) << "[MessageQueue] " << origin << ": enqueued " << message.size()
            << " bytes into page " << index;
    NotifyQueueChanged(origin);
    return QueueError::kNone;
}

QueueError MessageQueue::EnqueueMessages(const MessageOrigin& origin,
                                         const std::vector<std::string>& messages,
                                         size_t* accepted) {
    size_t stored = 0;
    QueueError err = QueueError::kNone;
    for (const auto& message : messages) {
        err = Enqueue(origin, message);
        if (err != QueueError::kNone) {
            break;
        }
        ++stored;
    }
    if (accepted) {
        *accepted = stored;
    }
    return err;
}

OverweightHandle MessageQueue::ParkOversized(const MessageOrigin& origin, std::string_view message) {
    const OverweightHandle handle = overweight_.Insert(
            origin, message,
            absl::StrCat("message of ", message.size(), " bytes exceeds page heap of ", options_.heap_size));
    LOG(INFO) << "[MessageQueue] Parked oversized message from " << origin << " as overweight " << handle;
    events_.Publish(EventBus::EventType::MESSAGE_OVERWEIGHT,
                    MessageOverweightEvent{origin, handle, overweight_.Find(handle)->reason});
    NotifyQueueChanged(origin);
    return handle;
}

// ============================================================================
// Service path
// ============================================================================

ServiceReport MessageQueue::Service(Weight weight_limit) {
    auto token = guard_.TryAcquire();
    if (!token.has_value()) {
        LOG(WARNING) << "[MessageQueue] Service called while the queue is already in use";
        ServiceReport report;
        report.stop_reason = StopReason::kRecursiveDisallowed;
        return report;
    }

    ServiceContext ctx{*token, WeightMeter(weight_limit)};
    ctx.report.stop_reason = RunServiceLoop(ctx);
    ctx.report.weight_used = ctx.meter.Consumed();
    ctx.report.origins_touched = ctx.touched.size();

    VLOG(1) << "[MessageQueue] Service(" << weight_limit << "): processed=" << ctx.report.processed
            << " overweight=" << ctx.report.overweight
            << " temporary_failures=" << ctx.report.temporary_failures
            << " weight_used=" << ctx.report.weight_used
            << " origins=" << ctx.report.origins_touched
            << " stop=" << StopReasonName(ctx.report.stop_reason);
    return ctx.report;
}

ServiceReport MessageQueue::ServiceBlock() {
    return Service(options_.service_weight);
}

ServiceReport MessageQueue::ServiceIdle(Weight remaining_weight) {
    return Service(std::min(remaining_weight, options_.idle_max_service_weight));
}

StopReason MessageQueue::RunServiceLoop(ServiceContext& ctx) {
    // Each pass visits at most the members present when it started; a pass
    // without progress ends the invocation
    size_t pass_size = ring_.Size();
    size_t visited = 0;
    bool pass_progress = false;

    while (true) {
        const std::optional<MessageOrigin> head = ring_.Head();
        if (!head.has_value()) {
            return StopReason::kRingEmpty;
        }
        if (ctx.meter.Exhausted()) {
            return StopReason::kWeightExhausted;
        }

        // The head moves to the tail before its turn, so a turn that stops
        // the invocation leaves the next origin at the head
        if (!ctx.meter.Consume(weights_->BumpServiceHead())) {
            return StopReason::kWeightExhausted;
        }
        ring_.Advance();
        const MessageOrigin& origin = *head;

        if (IsPaused(origin)) {
            VLOG(2) << "[MessageQueue] Skipping paused origin " << origin;
        } else {
            TurnResult turn = ServiceOrigin(ctx, origin);
            if (turn.stop) {
                return turn.stop_reason;
            }
            pass_progress = pass_progress || turn.progress;
        }

        if (++visited >= pass_size) {
            if (!pass_progress) {
                return StopReason::kNoProgress;
            }
            pass_size = ring_.Size();
            visited = 0;
            pass_progress = false;
        }
    }
}

MessageQueue::TurnResult MessageQueue::ServiceOrigin(ServiceContext& ctx, const MessageOrigin& origin) {
    TurnResult turn;
    if (!ctx.meter.Consume(weights_->ServiceQueueBase())) {
        turn.stop = true;
        turn.stop_reason = StopReason::kWeightExhausted;
        return turn;
    }
    ctx.touched.insert(origin);

    uint32_t serviced = 0;
    std::optional<PageIndex> loaded_page;
    std::optional<PageIndex> first_page;

    while (true) {
        BookState* book = ledger_.Find(origin);
        if (book == nullptr || book->IsEmpty()) {
            break;
        }
        if (options_.max_messages_per_turn > 0 && serviced >= options_.max_messages_per_turn) {
            break;
        }
        const PageIndex index = book->begin;
        if (options_.max_messages_per_turn == 0 && first_page.has_value() && index != *first_page) {
            break;
        }

        if (!loaded_page.has_value() || *loaded_page != index) {
            if (!ctx.meter.Consume(weights_->ServicePageBase())) {
                turn.stop = true;
                turn.stop_reason = StopReason::kWeightExhausted;
                break;
            }
            loaded_page = index;

            std::string diagnostic;
            const Page* page = pages_.Get(origin, index);
            if (page == nullptr) {
                diagnostic = absl::StrCat("page ", index, " missing from window [",
                                          book->begin, ", ", book->end, ")");
            } else {
                page->Validate(&diagnostic);
            }
            if (!diagnostic.empty()) {
                QuarantinePage(ctx.token, ctx.report, origin, index, std::move(diagnostic));
                turn.progress = true;
                continue;
            }
            if (!first_page.has_value()) {
                first_page = index;
            }
        }

        const ItemOutcome outcome = ServiceFront(ctx, origin, index);
        bool end_turn = false;
        switch (outcome) {
            case ItemOutcome::kConsumed:
            case ItemOutcome::kParked:
                ++serviced;
                turn.progress = true;
                break;
            case ItemOutcome::kQuarantined:
                turn.progress = true;
                break;
            case ItemOutcome::kRetry:
            case ItemOutcome::kInsufficientWeight:
                end_turn = true;
                break;
            case ItemOutcome::kBudgetTooSmall:
                turn.stop = true;
                turn.stop_reason = StopReason::kBudgetTooSmall;
                end_turn = true;
                break;
            case ItemOutcome::kOutOfWeight:
                turn.stop = true;
                turn.stop_reason = StopReason::kWeightExhausted;
                end_turn = true;
                break;
        }
        if (end_turn) {
            break;
        }
    }
    return turn;
}

MessageQueue::ItemOutcome MessageQueue::ServiceFront(ServiceContext& ctx,
                                                     const MessageOrigin& origin,
                                                     PageIndex index) {
    if (!ctx.meter.Consume(weights_->ServicePageItem())) {
        return ItemOutcome::kOutOfWeight;
    }

    std::string_view view;
    const Page* page = pages_.Get(origin, index);
    if (page == nullptr || !page->PeekFront(view)) {
        QuarantinePage(ctx.token, ctx.report, origin, index, "front message unreadable");
        return ItemOutcome::kQuarantined;
    }
    // The handler may enqueue into this very page, which can move its heap
    const std::string message(view);
    const uint32_t message_index = page->first_index();

    const bool first_attempt = !ctx.attempted;
    ctx.attempted = true;

    const Weight ceiling = ctx.meter.Remaining();
    ProcessResult result = handler_->Process(origin, message, ceiling);
    if (result.weight_used > ceiling) {
        LOG(WARNING) << "[MessageQueue] Handler reported " << result.weight_used
                     << " weight for a message from " << origin << " with ceiling " << ceiling
                     << "; charging the ceiling";
    }
    const Weight charged = ctx.meter.ConsumeUpTo(result.weight_used);

    switch (result.status) {
        case ProcessStatus::kSuccess:
            ConsumeFront(ctx.token, ctx.report, origin, index);
            ctx.report.processed += 1;
            VLOG(3) << "[MessageQueue] " << origin << ": processed message " << message_index
                    << " of page " << index << " for " << charged << " weight";
            events_.Publish(EventBus::EventType::MESSAGE_PROCESSED,
                            MessageProcessedEvent{origin, index, message_index, charged});
            return ItemOutcome::kConsumed;

        case ProcessStatus::kPermanentFailure:
            ParkFront(ctx.token, ctx.report, origin, index, message_index, message, std::move(result.reason));
            return ItemOutcome::kParked;

        case ProcessStatus::kTemporaryFailure: {
            Page* mutable_page = pages_.GetMutable(origin, index);
            const uint32_t attempts = mutable_page ? mutable_page->NoteTemporaryFailure() : 0;
            if (attempts > options_.max_temporary_failures) {
                LOG(WARNING) << "[MessageQueue] " << origin << ": message " << message_index
                             << " of page " << index << " failed " << attempts
                             << " times in a row, parking it";
                ParkFront(ctx.token, ctx.report, origin, index, message_index, message,
                          absl::StrCat("escalated after ", attempts, " temporary failures: ", result.reason));
                return ItemOutcome::kParked;
            }
            ctx.report.temporary_failures += 1;
            VLOG(2) << "[MessageQueue] " << origin << ": message " << message_index
                    << " temporarily unprocessable (attempt " << attempts << "): " << result.reason;
            events_.Publish(EventBus::EventType::PROCESSING_FAILED,
                            ProcessingFailedEvent{origin, index, message_index, result.reason, attempts});
            return ItemOutcome::kRetry;
        }

        case ProcessStatus::kInsufficientWeight:
            if (options_.max_message_weight != 0 && result.weight_required > options_.max_message_weight) {
                ParkFront(ctx.token, ctx.report, origin, index, message_index, message,
                          absl::StrCat("requires ", result.weight_required,
                                       " weight, above the per-message limit of ", options_.max_message_weight));
                return ItemOutcome::kParked;
            }
            VLOG(2) << "[MessageQueue] " << origin << ": message " << message_index
                    << " needs " << result.weight_required << " weight, " << ceiling << " left";
            return first_attempt ? ItemOutcome::kBudgetTooSmall : ItemOutcome::kInsufficientWeight;
    }
    return ItemOutcome::kInsufficientWeight;
}

void MessageQueue::ConsumeFront(const ServiceToken& token,
                                ServiceReport& report,
                                const MessageOrigin& origin,
                                PageIndex index) {
    BookState* book = ledger_.Find(origin);
    CHECK(book != nullptr) << "Servicing " << origin << " without a book";

    PageStore::ConsumeResult consumed;
    if (!pages_.MarkConsumed(origin, *book, index, consumed)) {
        QuarantinePage(token, report, origin, index, "front message could not be consumed");
        return;
    }
    if (consumed.reaped) {
        events_.Publish(EventBus::EventType::PAGE_REAPED, PageReapedEvent{origin, index});
    }
    if (ledger_.NoteConsumed(*book, consumed.payload_size)) {
        RetireBookIfEmpty(origin);
    }
    NotifyQueueChanged(origin);
}

void MessageQueue::ParkFront(const ServiceToken& token,
                             ServiceReport& report,
                             const MessageOrigin& origin,
                             PageIndex index,
                             uint32_t message_index,
                             const std::string& message,
                             std::string reason) {
    const OverweightHandle handle = overweight_.Insert(origin, message, reason, index, message_index);
    LOG(INFO) << "[MessageQueue] " << origin << ": message " << message_index << " of page " << index
              << " parked as overweight " << handle << ": " << reason;
    ConsumeFront(token, report, origin, index);
    report.overweight += 1;
    events_.Publish(EventBus::EventType::MESSAGE_OVERWEIGHT,
                    MessageOverweightEvent{origin, handle, std::move(reason)});
}

void MessageQueue::QuarantinePage(const ServiceToken& /*token*/,
                                  ServiceReport& report,
                                  const MessageOrigin& origin,
                                  PageIndex index,
                                  std::string diagnostic) {
    BookState* book = ledger_.Find(origin);
    CHECK(book != nullptr) << "Quarantining a page of " << origin << " without a book";

    events_.Publish(EventBus::EventType::PAGE_QUARANTINED,
                    PageQuarantinedEvent{origin, index, diagnostic});
    pages_.Quarantine(origin, *book, index, std::move(diagnostic));

    // Re-derive the book from the pages left in its window
    uint64_t live_count = 0;
    uint64_t live_size = 0;
    for (PageIndex i = book->begin; i < book->end; ++i) {
        if (const Page* page = pages_.Get(origin, i)) {
            live_count += page->remaining();
            live_size += page->remaining_size();
        }
    }
    const uint64_t dropped_count = book->message_count - std::min(book->message_count, live_count);
    const uint64_t dropped_size = book->size - std::min(book->size, live_size);
    if (ledger_.NoteDropped(*book, dropped_count, dropped_size) || book->IsEmpty()) {
        RetireBookIfEmpty(origin);
    }
    report.quarantined_pages += 1;
    VLOG(1) << "[MessageQueue] " << origin << ": quarantine dropped " << dropped_count
            << " messages, " << Footprint(origin).message_count << " left";
    NotifyQueueChanged(origin);
}

void MessageQueue::RetireBookIfEmpty(const MessageOrigin& origin) {
    BookState* book = ledger_.Find(origin);
    if (book == nullptr || !book->IsEmpty()) {
        return;
    }
    ring_.Unlink(origin);
    if (book->PageCount() != 0) {
        LOG(ERROR) << "[MessageQueue] Empty book of " << origin << " still spans pages ["
                   << book->begin << ", " << book->end << ")";
        return;
    }
    ledger_.Erase(origin);
}

// ============================================================================
// Overweight execution
// ============================================================================

QueueError MessageQueue::ExecuteOverweight(OverweightHandle handle, Weight weight_limit, Weight& weight_used) {
    weight_used = 0;
    auto token = guard_.TryAcquire();
    if (!token.has_value()) {
        return QueueError::kRecursiveDisallowed;
    }

    const OverweightEntry* entry = overweight_.Find(handle);
    if (entry == nullptr) {
        return QueueError::kNotFound;
    }
    const MessageOrigin origin = entry->origin;
    if (IsPaused(origin)) {
        return QueueError::kQueuePaused;
    }

    WeightMeter meter(weight_limit);
    if (!meter.Consume(weights_->ExecuteOverweightBase())) {
        VLOG(1) << "[MessageQueue] Overweight " << handle << " needs " << weights_->ExecuteOverweightBase()
                << " base weight, limit is " << weight_limit;
        events_.Publish(EventBus::EventType::OVERWEIGHT_EXECUTED,
                        OverweightExecutedEvent{handle, false, 0});
        return QueueError::kInsufficientWeight;
    }

    const std::string payload = entry->payload;
    const Weight ceiling = meter.Remaining();
    ProcessResult result = handler_->Process(origin, payload, ceiling);
    if (result.weight_used > ceiling) {
        LOG(WARNING) << "[MessageQueue] Handler reported " << result.weight_used
                     << " weight for overweight " << handle << " with ceiling " << ceiling;
    }
    meter.ConsumeUpTo(result.weight_used);
    weight_used = meter.Consumed();

    const bool success = result.status == ProcessStatus::kSuccess;
    if (success) {
        overweight_.Remove(handle);
        LOG(INFO) << "[MessageQueue] Executed overweight " << handle << " from " << origin
                  << " for " << weight_used << " weight";
    } else {
        VLOG(1) << "[MessageQueue] Overweight " << handle << " failed: "
                << ProcessStatusName(result.status) << " " << result.reason;
    }
    events_.Publish(EventBus::EventType::OVERWEIGHT_EXECUTED,
                    OverweightExecutedEvent{handle, success, weight_used});
    if (success) {
        NotifyQueueChanged(origin);
    }

    switch (result.status) {
        case ProcessStatus::kSuccess:
            return QueueError::kNone;
        case ProcessStatus::kTemporaryFailure:
            return QueueError::kTemporarilyUnprocessable;
        case ProcessStatus::kPermanentFailure:
            return QueueError::kProcessingFailed;
        case ProcessStatus::kInsufficientWeight:
            return QueueError::kInsufficientWeight;
    }
    return QueueError::kProcessingFailed;
}

QueueError MessageQueue::DiscardOverweight(OverweightHandle handle) {
    auto token = guard_.TryAcquire();
    if (!token.has_value()) {
        return QueueError::kRecursiveDisallowed;
    }
    const OverweightEntry* entry = overweight_.Find(handle);
    if (entry == nullptr) {
        return QueueError::kNotFound;
    }
    const MessageOrigin origin = entry->origin;
    overweight_.Remove(handle);
    LOG(INFO) << "[MessageQueue] Discarded overweight " << handle << " from " << origin;
    events_.Publish(EventBus::EventType::OVERWEIGHT_DISCARDED, OverweightDiscardedEvent{handle});
    NotifyQueueChanged(origin);
    return QueueError::kNone;
}

// ============================================================================
// Introspection
// ============================================================================

QueueFootprint MessageQueue::Footprint(const MessageOrigin& origin) const {
    QueueFootprint footprint;
    if (const BookState* book = ledger_.Find(origin)) {
        footprint.pages = book->PageCount();
        footprint.message_count = book->message_count;
        footprint.total_size = book->size;
    }
    footprint.overweight_count = overweight_.CountFor(origin);
    footprint.overweight_size = overweight_.SizeFor(origin);
    return footprint;
}

std::vector<std::string> MessageQueue::CheckIntegrity() const {
    std::vector<std::string> errors;
    size_t ready_books = 0;

    ledger_.ForEach([&](const MessageOrigin& origin, const BookState& book) {
        uint64_t count = 0;
        uint64_t size = 0;
        for (PageIndex i = book.begin; i < book.end; ++i) {
            const Page* page = pages_.Get(origin, i);
            if (page == nullptr) {
                errors.push_back(absl::StrCat(origin.ToString(), ": page ", i, " missing from window"));
                continue;
            }
            std::string diagnostic;
            if (!page->Validate(&diagnostic)) {
                errors.push_back(absl::StrCat(origin.ToString(), ": page ", i, ": ", diagnostic));
            }
            if (page->IsDrained()) {
                errors.push_back(absl::StrCat(origin.ToString(), ": drained page ", i, " not reaped"));
            }
            count += page->remaining();
            size += page->remaining_size();
        }
        if (count != book.message_count || size != book.size) {
            errors.push_back(absl::StrCat(origin.ToString(), ": book records ", book.message_count,
                                          " messages / ", book.size, " bytes, pages hold ",
                                          count, " / ", size));
        }
        if (book.IsEmpty()) {
            errors.push_back(absl::StrCat(origin.ToString(), ": empty book retained"));
        }
        if (book.ready_neighbours.has_value() != !book.IsEmpty()) {
            errors.push_back(absl::StrCat(origin.ToString(), ": ready link does not match pending work"));
        }
        if (book.ready_neighbours.has_value()) {
            ++ready_books;
            const BookState* next = ledger_.Find(book.ready_neighbours->next);
            if (next == nullptr || !next->ready_neighbours.has_value() ||
                next->ready_neighbours->prev != origin) {
                errors.push_back(absl::StrCat(origin.ToString(), ": broken ready link to ",
                                              book.ready_neighbours->next.ToString()));
            }
        }
    });

    pages_.ForEach([&](const PageKey& key, const Page&) {
        const BookState* book = ledger_.Find(key.origin);
        if (book == nullptr || key.index < book->begin || key.index >= book->end) {
            errors.push_back(absl::StrCat(key.origin.ToString(), ": page ", key.index,
                                          " outside its book window"));
        }
    });

    if (ready_books != ring_.Size()) {
        errors.push_back(absl::StrCat("ready ring size ", ring_.Size(), " but ", ready_books,
                                      " books are linked"));
    }
    if (ring_.Members().size() != ring_.Size()) {
        errors.push_back(absl::StrCat("ready ring walk visits ", ring_.Members().size(),
                                      " origins, expected ", ring_.Size()));
    }
    return errors;
}

bool MessageQueue::IsPaused(const MessageOrigin& origin) const {
    return paused_query_ && paused_query_(origin);
}

void MessageQueue::NotifyQueueChanged(const MessageOrigin& origin) {
    if (events_.SubscriberCount(EventBus::EventType::QUEUE_CHANGED) == 0) {
        return;
    }
    events_.Publish(EventBus::EventType::QUEUE_CHANGED, QueueChangedEvent{origin, Footprint(origin)});
}

} // namespace Wharf
