#pragma once

#include <string>
#include <vector>

#include "ht/anchor_strategy.h"
#include "ht/halftone_config.h"
#include "ht/halftone_error.h"
#include "ht/recipe.h"
#include "ht/rgba8.h"

namespace ht {

// Size of the image handed back by HalftoneEngine::convert().
enum class OutputScale : u8 {
    kSupersampled = 0, // canvas size, source size * supersample
    kNominal,          // downscaled back to the source size
};

const char *toString(OutputScale scale);

// Runtime configuration of one conversion. Plain values; validate() is run by
// the engine before anything is drawn.
struct HalftoneSettings {
    HalftoneMode mode = HalftoneMode::kBasic;
    AnchorStrategy anchor = AnchorStrategy::kTraditional;
    float dot_size = HALFTONE_DEFAULT_DOT_SIZE;
    i32 dot_resolution = HALFTONE_DEFAULT_DOT_RESOLUTION;
    float screen_angle = 0.0f;
    bool invert = false;
    // One color per recipe layer, in layer order.
    std::vector<RGBA8> colors;
    RGBA8 background = RGBA8::White();
    int supersample = HALFTONE_DEFAULT_SUPERSAMPLE;
    OutputScale output_scale = OutputScale::kSupersampled;

    // Settings for `mode` with the recipe's default colors filled in.
    static HalftoneSettings Defaults(HalftoneMode mode = HalftoneMode::kBasic);

    // Applies one string key/value pair, as received from a request form.
    //
    //   mode, anchor, dot_size, dot_resolution, screen_angle, invert,
    //   color (hex, appended), colors (comma separated hex), background,
    //   supersample, output_scale
    //
    // Older request names are accepted too: dot_spacing, angle,
    // traditional (true/false) and threshold (ignored).
    //
    // The first color or colors option replaces the recipe defaults. Changing
    // the mode refills the defaults unless colors were given explicitly.
    // Unknown keys and malformed values fail with INVALID_PARAMETER and
    // leave the settings untouched.
    Result<void, HalftoneError> setOption(const std::string &key,
                                          const std::string &value);

    Result<void, HalftoneError> validate() const;

    std::string toString() const;

  private:
    bool mColorsFromOptions = false;
};

} // namespace ht
