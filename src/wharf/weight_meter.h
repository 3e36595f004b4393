#pragma once

#include "types.h"

namespace Wharf {

/**
 * Budget of one service invocation. consumed only grows and never passes
 * limit.
 */
class WeightMeter {
public:
    explicit WeightMeter(Weight limit) : limit_(limit) {}

    bool CanAfford(Weight cost) const { return cost <= limit_ - consumed_; }

    // Fails without mutation if cost does not fit the remaining budget
    bool Consume(Weight cost);

    // Consumes min(cost, Remaining()) and returns what was charged
    Weight ConsumeUpTo(Weight cost);

    Weight Limit() const { return limit_; }
    Weight Consumed() const { return consumed_; }
    Weight Remaining() const { return limit_ - consumed_; }
    bool Exhausted() const { return consumed_ == limit_; }

private:
    Weight limit_;
    Weight consumed_ = 0;
};

} // namespace Wharf
