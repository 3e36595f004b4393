#pragma once

#include <cstddef>
#include <cstdint>

/// Queue defaults used when no configuration file overrides them
/// Default page heap bound in bytes
const size_t kDefaultPageHeapSize = 64 * 1024;
/// Messages serviced from one origin before yielding to the next
const int kDefaultMaxMessagesPerTurn = 1;
/// Per-block service budget
const uint64_t kDefaultServiceWeight = 1'000'000'000;
/// Upper bound of the idle-time service budget; 0 disables idle servicing
const uint64_t kDefaultIdleMaxServiceWeight = 0;
