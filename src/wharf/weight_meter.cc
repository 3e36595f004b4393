#include "weight_meter.h"

#include <algorithm>

namespace Wharf {

bool WeightMeter::Consume(Weight cost) {
    if (!CanAfford(cost)) {
        return false;
    }
    consumed_ += cost;
    return true;
}

Weight WeightMeter::ConsumeUpTo(Weight cost) {
    const Weight charged = std::min(cost, Remaining());
    consumed_ += charged;
    return charged;
}

} // namespace Wharf
