#include "ht/time.h"

#include <chrono>

namespace ht {

u32 millis() {
    using namespace std::chrono;
    return static_cast<u32>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
            .count());
}

} // namespace ht
