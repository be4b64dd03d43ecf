#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "ht/halftone_config.h"
#include "ht/halftone_error.h"
#include "ht/int.h"
#include "ht/rgba8.h"
#include "ht/screen_config.h"

namespace ht {

class RasterImage;
class CoverageRaster;

// One sampling + rasterizing pass.
struct LayerSpec {
    ScreenConfig screen;
    // Fill the canvas with the job background before drawing. Only legal on
    // the first layer of a job.
    bool clears_background = false;
    // Sample this image instead of the job source. Not owned; must match the
    // source size.
    const RasterImage *derived_source = nullptr;
};

// Ordered layers sharing one source, one background and one canvas.
struct HalftoneJob {
    std::vector<LayerSpec> layers;
    RGBA8 background = RGBA8::White();
    int supersample = HALFTONE_DEFAULT_SUPERSAMPLE;
};

// Diagnostics for one layer pass.
struct LayerStats {
    u64 cells_visited = 0;
    u64 dots_drawn = 0;
    u64 rejected_out_of_bounds = 0;
    u64 rejected_transparent = 0;
    u64 below_threshold = 0;
    float min_radius = 0.0f; // over drawn dots, 0 when none were drawn
    float max_radius = 0.0f;

    u64 rejected() const {
        return rejected_out_of_bounds + rejected_transparent;
    }
};

struct HalftoneStats {
    std::vector<LayerStats> layers;

    u64 dotsDrawn() const;
    u64 samplesRejected() const;
    u64 cellsVisited() const;
    std::string toString() const;
};

// Polled between grid rows; returning true abandons the call.
using CancelCallback = std::function<bool()>;

// Runs the layers of a job, in order, onto one shared output canvas. Holds no
// state between calls; one instance may be reused.
class LayerCompositor {
  public:
    LayerCompositor() = default;
    explicit LayerCompositor(CancelCallback cancel)
        : mCancel(std::move(cancel)) {}

    // Checks the whole job against `source`. Nothing is drawn on failure.
    static Result<void, HalftoneError> validate(const HalftoneJob &job,
                                                const RasterImage &source);

    // Renders `job` into `out`, which is resized to the supersampled canvas
    // (source size * job.supersample) when its size differs. `stats` is
    // optional.
    Result<void, HalftoneError> composite(const HalftoneJob &job,
                                          const RasterImage &source,
                                          RasterImage *out,
                                          HalftoneStats *stats = nullptr) const;

  private:
    // Returns false when cancelled.
    bool renderLayer(const LayerSpec &layer, const RasterImage &source,
                     int supersample, CoverageRaster *coverage,
                     LayerStats *stats) const;

    bool cancelled() const { return mCancel && mCancel(); }

    CancelCallback mCancel;
};

} // namespace ht
