#include "ht/halftone_engine.h"

#include <utility>

#include "ht/downscale.h"
#include "ht/error.h"
#include "ht/log.h"
#include "ht/recipe.h"
#include "ht/screen_geometry.h"
#include "ht/shadow_mask.h"
#include "ht/supersample.h"
#include "ht/time.h"
#include "ht/timeout.h"
#include "ht/warn.h"

namespace ht {

namespace {

typedef HalftoneResult<HalftoneOutput> ConvertResult;

CancelCallback makeCancelCallback(const ConvertOptions &options) {
    if (options.timeout_ms == 0) {
        return options.should_cancel;
    }
    const CancelCallback user = options.should_cancel;
    const Timeout budget(millis(), options.timeout_ms);
    return [user, budget]() -> bool {
        if (user && user()) {
            return true;
        }
        return budget.done(millis());
    };
}

} // namespace

HalftoneResult<HalftoneJob>
HalftoneEngine::buildJob(const HalftoneSettings &settings,
                         const RasterImage *shadow_mask) {
    typedef HalftoneResult<HalftoneJob> R;
    const Recipe &recipe = recipeFor(settings.mode);
    if (settings.colors.size() != recipe.colorCount()) {
        return R::failure(HalftoneError::INVALID_PARAMETER,
                          "color count does not match the recipe");
    }

    HalftoneJob job;
    job.background = settings.background;
    job.supersample = settings.supersample;
    for (size i = 0; i < recipe.layers.size(); ++i) {
        const RecipeLayer &step = recipe.layers[i];
        LayerSpec layer;
        layer.screen.angle =
            normalizeAngle(settings.screen_angle + step.angle_offset);
        layer.screen.dot_size = settings.dot_size;
        layer.screen.dot_resolution = settings.dot_resolution;
        layer.screen.color = settings.colors[i].opaque();
        layer.screen.invert = settings.invert;
        layer.screen.anchor = settings.anchor;
        layer.clears_background = step.clears_background;
        if (step.source == LayerSource::kShadowMask) {
            if (!shadow_mask) {
                return R::failure(HalftoneError::INVALID_PARAMETER,
                                  "recipe needs a shadow mask");
            }
            layer.derived_source = shadow_mask;
        }
        job.layers.push_back(layer);
    }
    return R::success(job);
}

ConvertResult HalftoneEngine::convert(const RasterImage *source,
                                      const HalftoneSettings &settings,
                                      const ConvertOptions &options) const {
    if (!source || source->empty()) {
        HT_WARN("halftone: no source image");
        return ConvertResult::failure(HalftoneError::SOURCE_IMAGE_MISSING,
                                      "no source image");
    }
    Result<void, HalftoneError> valid = settings.validate();
    if (!valid.ok()) {
        HT_WARN("halftone: " << valid.message());
        return ConvertResult::failure(valid);
    }

    const Recipe &recipe = recipeFor(settings.mode);
    RasterImage shadow_mask;
    if (recipe.needsShadowMask()) {
        shadow_mask = deriveShadowMask(*source);
    }
    HalftoneResult<HalftoneJob> job = buildJob(settings, &shadow_mask);
    if (!job.ok()) {
        HT_WARN("halftone: " << job.message());
        return ConvertResult::failure(job);
    }

    const u32 start = millis();
    HalftoneOutput output;
    LayerCompositor compositor(makeCancelCallback(options));
    Result<void, HalftoneError> drawn = compositor.composite(
        job.value(), *source, &output.image, &output.stats);
    if (!drawn.ok()) {
        HT_WARN("halftone: " << drawn.message());
        return ConvertResult::failure(drawn);
    }
    output.scale = settings.supersample;

    if (settings.output_scale == OutputScale::kNominal &&
        settings.supersample != SUPER_SAMPLE_NONE) {
        RasterImage nominal(source->width(), source->height());
        if (!downscale(output.image, &nominal)) {
            HT_ERROR("halftone: downscale of " << output.image.width() << "x"
                                               << output.image.height()
                                               << " failed");
            return ConvertResult::failure(HalftoneError::INVALID_PARAMETER,
                                          "downscale failed");
        }
        output.image = std::move(nominal);
        output.scale = 1;
    }

    HT_LOG_ENGINE("halftone: " << recipe.name << " " << source->width() << "x"
                               << source->height() << " -> "
                               << output.image.width() << "x"
                               << output.image.height() << " "
                               << output.stats.toString() << " in "
                               << (millis() - start) << "ms");
    return ConvertResult::success(std::move(output));
}

} // namespace ht
