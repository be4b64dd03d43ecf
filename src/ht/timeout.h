/// @file timeout.h
/// @brief Timeout with rollover-safe arithmetic
///
/// The caller supplies timestamps in consistent units (for example from
/// ht::millis()).

#pragma once

#include "ht/int.h"

namespace ht {

/// @code
/// Timeout timeout(millis(), 1000);  // 1 second budget
/// while (!timeout.done(millis())) {
///     ...
/// }
/// @endcode
class Timeout {
  public:
    /// @brief Default constructor - creates an already-expired timeout
    Timeout() : mStartTime(0), mDuration(0) {}

    Timeout(u32 start_time, u32 duration)
        : mStartTime(start_time), mDuration(duration) {}

    /// @brief true if elapsed time >= duration. Handles u32 rollover.
    bool done(u32 current_time) const {
        u32 elapsed_time = current_time - mStartTime; // Rollover-safe
        return elapsed_time >= mDuration;
    }

    u32 elapsed(u32 current_time) const { return current_time - mStartTime; }

    void reset(u32 start_time) { mStartTime = start_time; }

    u32 duration() const { return mDuration; }

  private:
    u32 mStartTime;
    u32 mDuration;
};

} // namespace ht
