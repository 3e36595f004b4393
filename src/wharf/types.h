#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace Wharf {

using Weight = uint64_t;
using PageIndex = uint32_t;
using OverweightHandle = uint64_t;

/**
 * Identity of a message queue. Messages of one origin are processed strictly
 * in enqueue order; nothing is promised across origins.
 */
struct MessageOrigin {
    enum class Kind : uint8_t {
        kHere = 0,     // local subsystem
        kParent = 1,   // relay chain
        kSibling = 2,  // sibling chain identified by para_id
    };

    Kind kind = Kind::kHere;
    uint32_t para_id = 0;

    static MessageOrigin Here() { return MessageOrigin{Kind::kHere, 0}; }
    static MessageOrigin Parent() { return MessageOrigin{Kind::kParent, 0}; }
    static MessageOrigin Sibling(uint32_t id) { return MessageOrigin{Kind::kSibling, id}; }

    std::string ToString() const;

    bool operator==(const MessageOrigin& other) const {
        return kind == other.kind && para_id == other.para_id;
    }
    bool operator!=(const MessageOrigin& other) const { return !(*this == other); }
    bool operator<(const MessageOrigin& other) const {
        if (kind != other.kind) return kind < other.kind;
        return para_id < other.para_id;
    }

    template <typename H>
    friend H AbslHashValue(H h, const MessageOrigin& origin) {
        return H::combine(std::move(h), static_cast<uint8_t>(origin.kind), origin.para_id);
    }
};

std::ostream& operator<<(std::ostream& os, const MessageOrigin& origin);

/**
 * Key of the page table
 */
struct PageKey {
    MessageOrigin origin;
    PageIndex index = 0;

    bool operator==(const PageKey& other) const {
        return origin == other.origin && index == other.index;
    }

    template <typename H>
    friend H AbslHashValue(H h, const PageKey& key) {
        return H::combine(std::move(h), key.origin, key.index);
    }
};

/**
 * Errors returned by the queue's public entry points
 */
enum class QueueError {
    kNone = 0,
    kTooLarge,                  // message exceeds the page heap bound
    kNotFound,                  // unknown (or already executed) overweight handle
    kInsufficientWeight,        // budget cannot cover the attempt
    kTemporarilyUnprocessable,  // handler asked to retry later
    kProcessingFailed,          // handler rejected the message permanently
    kQueuePaused,               // origin is paused
    kRecursiveDisallowed,       // called while a service invocation is running
};

const char* QueueErrorName(QueueError error);

/**
 * Outcome reported by the message handler
 */
enum class ProcessStatus {
    kSuccess,
    kTemporaryFailure,
    kPermanentFailure,
    kInsufficientWeight,
};

const char* ProcessStatusName(ProcessStatus status);

struct ProcessResult {
    ProcessStatus status = ProcessStatus::kSuccess;
    // Weight actually spent by the handler, whatever the outcome
    Weight weight_used = 0;
    // Only meaningful for kInsufficientWeight: what a retry would need
    Weight weight_required = 0;
    std::string reason;

    static ProcessResult Success(Weight used) {
        return ProcessResult{ProcessStatus::kSuccess, used, 0, {}};
    }
    static ProcessResult TemporaryFailure(std::string why, Weight used = 0) {
        return ProcessResult{ProcessStatus::kTemporaryFailure, used, 0, std::move(why)};
    }
    static ProcessResult PermanentFailure(std::string why, Weight used = 0) {
        return ProcessResult{ProcessStatus::kPermanentFailure, used, 0, std::move(why)};
    }
    static ProcessResult InsufficientWeight(Weight required, Weight used = 0) {
        return ProcessResult{ProcessStatus::kInsufficientWeight, used, required, {}};
    }
};

/**
 * Per-origin storage usage, queued and parked
 */
struct QueueFootprint {
    uint64_t pages = 0;
    uint64_t message_count = 0;
    uint64_t total_size = 0;
    uint64_t overweight_count = 0;
    uint64_t overweight_size = 0;

    bool operator==(const QueueFootprint& other) const {
        return pages == other.pages &&
               message_count == other.message_count &&
               total_size == other.total_size &&
               overweight_count == other.overweight_count &&
               overweight_size == other.overweight_size;
    }
    bool operator!=(const QueueFootprint& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const QueueFootprint& footprint);

enum class StopReason {
    kRingEmpty,
    kWeightExhausted,
    kNoProgress,
    kBudgetTooSmall,
    kRecursiveDisallowed,
};

const char* StopReasonName(StopReason reason);

/**
 * Summary of one Service() invocation
 */
struct ServiceReport {
    uint64_t processed = 0;           // handler returned Success
    uint64_t overweight = 0;          // parked in the overweight store
    uint64_t temporary_failures = 0;  // left at the front for a retry
    uint64_t quarantined_pages = 0;
    Weight weight_used = 0;
    uint64_t origins_touched = 0;     // distinct origins given a turn
    StopReason stop_reason = StopReason::kRingEmpty;
};

} // namespace Wharf
