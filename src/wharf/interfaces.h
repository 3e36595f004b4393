#pragma once

#include <string_view>
#include "types.h"

namespace Wharf {

/**
 * Interface for message processing. Implementations decode and execute one
 * message within weight_ceiling and report what they actually spent.
 */
class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;

    virtual ProcessResult Process(const MessageOrigin& origin,
                                  std::string_view message,
                                  Weight weight_ceiling) = 0;
};

/**
 * Interface for the overhead weight table charged by the service loop
 */
class IWeightInfo {
public:
    virtual ~IWeightInfo() = default;

    // Loading an origin's book at the start of its turn
    virtual Weight ServiceQueueBase() const = 0;
    // Loading a page within a turn
    virtual Weight ServicePageBase() const = 0;
    // Decoding one message and bookkeeping around the handler call
    virtual Weight ServicePageItem() const = 0;
    // Rotating the ready ring to the next origin
    virtual Weight BumpServiceHead() const = 0;
    // Fixed cost of a manual overweight execution
    virtual Weight ExecuteOverweightBase() const = 0;
};

} // namespace Wharf
