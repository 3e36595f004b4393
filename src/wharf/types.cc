#include "types.h"

namespace Wharf {

std::string MessageOrigin::ToString() const {
    switch (kind) {
        case Kind::kHere:
            return "Here";
        case Kind::kParent:
            return "Parent";
        case Kind::kSibling:
            return "Sibling(" + std::to_string(para_id) + ")";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const MessageOrigin& origin) {
    return os << origin.ToString();
}

std::ostream& operator<<(std::ostream& os, const QueueFootprint& footprint) {
    return os << "{pages=" << footprint.pages
              << ", messages=" << footprint.message_count
              << ", size=" << footprint.total_size
              << ", overweight=" << footprint.overweight_count
              << ", overweight_size=" << footprint.overweight_size << "}";
}

const char* QueueErrorName(QueueError error) {
    switch (error) {
        case QueueError::kNone: return "None";
        case QueueError::kTooLarge: return "TooLarge";
        case QueueError::kNotFound: return "NotFound";
        case QueueError::kInsufficientWeight: return "InsufficientWeight";
        case QueueError::kTemporarilyUnprocessable: return "TemporarilyUnprocessable";
        case QueueError::kProcessingFailed: return "ProcessingFailed";
        case QueueError::kQueuePaused: return "QueuePaused";
        case QueueError::kRecursiveDisallowed: return "RecursiveDisallowed";
    }
    return "Unknown";
}

const char* ProcessStatusName(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::kSuccess: return "Success";
        case ProcessStatus::kTemporaryFailure: return "TemporaryFailure";
        case ProcessStatus::kPermanentFailure: return "PermanentFailure";
        case ProcessStatus::kInsufficientWeight: return "InsufficientWeight";
    }
    return "Unknown";
}

const char* StopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::kRingEmpty: return "RingEmpty";
        case StopReason::kWeightExhausted: return "WeightExhausted";
        case StopReason::kNoProgress: return "NoProgress";
        case StopReason::kBudgetTooSmall: return "BudgetTooSmall";
        case StopReason::kRecursiveDisallowed: return "RecursiveDisallowed";
    }
    return "Unknown";
}

} // namespace Wharf
