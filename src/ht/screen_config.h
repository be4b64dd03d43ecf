#pragma once

#include <string>

#include "ht/anchor_strategy.h"
#include "ht/halftone_error.h"
#include "ht/int.h"
#include "ht/rgba8.h"

namespace ht {

// Parameters of one halftone screen (one layer pass).
struct ScreenConfig {
    float angle = 0.0f;        // degrees, normalized mod 360 when used
    float dot_size = 10.0f;    // maximum dot diameter, output units
    i32 dot_resolution = 5;    // grid step, output units
    RGBA8 color = RGBA8::Black();
    bool invert = false;
    AnchorStrategy anchor = AnchorStrategy::kTraditional;

    // Checks the ranges above. `what` prefixes the error message.
    Result<void, HalftoneError> validate(const char *what = "screen") const;

    std::string toString() const;
};

} // namespace ht
