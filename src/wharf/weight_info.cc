#include "weight_info.h"

namespace Wharf {

WeightTable WeightTable::FromConfig(const WharfConfig::Weights& weights) {
    Values values;
    values.service_queue_base = weights.service_queue_base.get();
    values.service_page_base = weights.service_page_base.get();
    values.service_page_item = weights.service_page_item.get();
    values.bump_service_head = weights.bump_service_head.get();
    values.execute_overweight_base = weights.execute_overweight_base.get();
    return WeightTable(values);
}

} // namespace Wharf
