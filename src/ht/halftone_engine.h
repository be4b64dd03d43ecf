#pragma once

#include "ht/halftone_error.h"
#include "ht/halftone_settings.h"
#include "ht/int.h"
#include "ht/layer_compositor.h"
#include "ht/raster_image.h"

namespace ht {

struct ConvertOptions {
    // Polled once per grid row; returning true ends the call with CANCELLED.
    CancelCallback should_cancel;
    // Wall-clock budget for the call, 0 for none.
    u32 timeout_ms = 0;
};

struct HalftoneOutput {
    RasterImage image;
    HalftoneStats stats;
    // image size / source size
    int scale = 1;
};

// Converts a source image into a halftone according to HalftoneSettings.
//
// The engine keeps no state between calls: convert() is a function of its
// arguments, so one engine may serve concurrent callers as long as each
// call gets its own settings and options.
//
//   HalftoneSettings settings =
//       HalftoneSettings::Defaults(HalftoneMode::kDuotone);
//   HalftoneResult<HalftoneOutput> out =
//       HalftoneEngine().convert(&src, settings);
//   if (!out.ok()) { ... out.error(), out.message() ... }
class HalftoneEngine {
  public:
    HalftoneResult<HalftoneOutput>
    convert(const RasterImage *source, const HalftoneSettings &settings,
            const ConvertOptions &options = ConvertOptions()) const;

    // Expands the recipe of `settings` into layers. `shadow_mask` is sampled
    // by layers that want the derived mask; it may be null only when the
    // recipe has none. `settings` must already be valid.
    static HalftoneResult<HalftoneJob>
    buildJob(const HalftoneSettings &settings, const RasterImage *shadow_mask);
};

} // namespace ht
