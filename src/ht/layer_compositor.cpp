#include "ht/layer_compositor.h"

#include <sstream>

#include "ht/coverage_raster.h"
#include "ht/dot_rasterizer.h"
#include "ht/draw_visitor.h"
#include "ht/grid_sampler.h"
#include "ht/log.h"
#include "ht/raster_image.h"
#include "ht/screen_geometry.h"
#include "ht/supersample.h"

namespace ht {

u64 HalftoneStats::dotsDrawn() const {
    u64 total = 0;
    for (size i = 0; i < layers.size(); ++i) {
        total += layers[i].dots_drawn;
    }
    return total;
}

u64 HalftoneStats::samplesRejected() const {
    u64 total = 0;
    for (size i = 0; i < layers.size(); ++i) {
        total += layers[i].rejected();
    }
    return total;
}

u64 HalftoneStats::cellsVisited() const {
    u64 total = 0;
    for (size i = 0; i < layers.size(); ++i) {
        total += layers[i].cells_visited;
    }
    return total;
}

std::string HalftoneStats::toString() const {
    std::ostringstream out;
    out << "HalftoneStats(layers=" << layers.size()
        << ", cells=" << cellsVisited() << ", dots=" << dotsDrawn()
        << ", rejected=" << samplesRejected() << ")";
    return out.str();
}

Result<void, HalftoneError>
LayerCompositor::validate(const HalftoneJob &job, const RasterImage &source) {
    typedef Result<void, HalftoneError> R;
    if (source.empty()) {
        return R::failure(HalftoneError::SOURCE_IMAGE_MISSING,
                          "source image is empty");
    }
    if (job.layers.empty() ||
        job.layers.size() > static_cast<size>(HALFTONE_MAX_LAYERS)) {
        std::ostringstream msg;
        msg << "a job needs 1.." << HALFTONE_MAX_LAYERS << " layers, got "
            << job.layers.size();
        return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
    }
    if (!isSupportedSuperSample(job.supersample)) {
        std::ostringstream msg;
        msg << "unsupported supersample factor " << job.supersample;
        return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
    }
    for (size i = 0; i < job.layers.size(); ++i) {
        const LayerSpec &layer = job.layers[i];
        std::ostringstream what;
        what << "layer " << i;
        R screen = layer.screen.validate(what.str().c_str());
        if (!screen.ok()) {
            return screen;
        }
        if (layer.clears_background && i != 0) {
            std::ostringstream msg;
            msg << what.str() << ": only the first layer may clear the "
                << "background";
            return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
        }
        const RasterImage *derived = layer.derived_source;
        if (derived && (derived->width() != source.width() ||
                        derived->height() != source.height())) {
            std::ostringstream msg;
            msg << what.str() << ": derived source is " << derived->width()
                << "x" << derived->height() << ", source is "
                << source.width() << "x" << source.height();
            return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
        }
    }
    return R::success();
}

Result<void, HalftoneError>
LayerCompositor::composite(const HalftoneJob &job, const RasterImage &source,
                           RasterImage *out, HalftoneStats *stats) const {
    typedef Result<void, HalftoneError> R;
    if (!out) {
        return R::failure(HalftoneError::INVALID_PARAMETER,
                          "no output image given");
    }
    R valid = validate(job, source);
    if (!valid.ok()) {
        return valid;
    }

    const int s = job.supersample;
    const u32 canvas_w = source.width() * static_cast<u32>(s);
    const u32 canvas_h = source.height() * static_cast<u32>(s);
    if (out->width() != canvas_w || out->height() != canvas_h) {
        *out = RasterImage(canvas_w, canvas_h);
    }
    if (job.layers.front().clears_background) {
        out->fill(job.background);
    }

    if (stats) {
        stats->layers.assign(job.layers.size(), LayerStats());
    }

    CoverageRaster coverage(canvas_w, canvas_h);
    for (size i = 0; i < job.layers.size(); ++i) {
        const LayerSpec &layer = job.layers[i];
        LayerStats layer_stats;
        if (i > 0) {
            coverage.clear();
        }
        if (!renderLayer(layer, source, s, &coverage, &layer_stats)) {
            return R::failure(HalftoneError::CANCELLED,
                              "conversion cancelled");
        }
        XYDrawCoverage visitor(layer.screen.color.opaque(), out);
        coverage.draw(visitor);
        HT_LOG_RASTER("layer " << i << " " << layer.screen.toString()
                               << " dots=" << layer_stats.dots_drawn
                               << " pixels=" << visitor.pixelsWritten());
        if (stats) {
            stats->layers[i] = layer_stats;
        }
    }
    return R::success();
}

bool LayerCompositor::renderLayer(const LayerSpec &layer,
                                  const RasterImage &source, int supersample,
                                  CoverageRaster *coverage,
                                  LayerStats *stats) const {
    const ScreenConfig &screen = layer.screen;
    const RasterImage &sampled =
        layer.derived_source ? *layer.derived_source : source;

    const GridBounds bounds =
        computeGridBounds(source.width(), source.height(), screen.angle);
    GridSampler sampler(bounds, screen.dot_resolution, screen.angle, sampled,
                        screen.anchor);
    DotRasterizer rasterizer(coverage, supersample);

    u32 polled_rows = 0;
    DotSample sample;
    while (sampler.next(&sample)) {
        ++stats->cells_visited;
        switch (sample.status) {
        case SampleStatus::kOutOfBounds:
            ++stats->rejected_out_of_bounds;
            break;
        case SampleStatus::kTransparent:
            ++stats->rejected_transparent;
            break;
        case SampleStatus::kAccepted: {
            const float radius =
                dotRadius(sample.luminance, screen.dot_size, screen.invert);
            if (rasterizer.drawDot(sample.anchor, radius)) {
                if (stats->dots_drawn == 0) {
                    stats->min_radius = radius;
                    stats->max_radius = radius;
                } else {
                    stats->min_radius = HT_MIN(stats->min_radius, radius);
                    stats->max_radius = HT_MAX(stats->max_radius, radius);
                }
                ++stats->dots_drawn;
            } else {
                ++stats->below_threshold;
            }
            break;
        }
        }

        const u32 rows = sampler.rowsCompleted();
        if (rows - polled_rows >= HALFTONE_CANCEL_POLL_ROWS) {
            polled_rows = rows;
            if (cancelled()) {
                return false;
            }
        }
    }
    return true;
}

} // namespace ht
