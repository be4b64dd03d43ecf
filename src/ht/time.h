#pragma once

#include "ht/int.h"

namespace ht {

// Milliseconds from a monotonic clock. Wraps after ~49 days; pair with
// Timeout, which handles the rollover.
u32 millis();

} // namespace ht
