#pragma once

#include "interfaces.h"
#include "../common/configuration.h"

namespace Wharf {

/**
 * WeightTable is the weight table as loaded from configuration
 */
class WeightTable : public IWeightInfo {
public:
    struct Values {
        Weight service_queue_base = 0;
        Weight service_page_base = 0;
        Weight service_page_item = 0;
        Weight bump_service_head = 0;
        Weight execute_overweight_base = 0;
    };

    WeightTable() = default;
    explicit WeightTable(const Values& values) : values_(values) {}

    static WeightTable FromConfig(const WharfConfig::Weights& weights);

    Weight ServiceQueueBase() const override { return values_.service_queue_base; }
    Weight ServicePageBase() const override { return values_.service_page_base; }
    Weight ServicePageItem() const override { return values_.service_page_item; }
    Weight BumpServiceHead() const override { return values_.bump_service_head; }
    Weight ExecuteOverweightBase() const override { return values_.execute_overweight_base; }

    const Values& values() const { return values_; }

private:
    Values values_;
};

} // namespace Wharf
