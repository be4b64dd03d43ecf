#include "ht/recipe.h"

namespace ht {

namespace {

RecipeLayer layer(float angle_offset, u32 color, bool clears,
                  LayerSource source = LayerSource::kOriginal) {
    RecipeLayer out;
    out.angle_offset = angle_offset;
    out.default_color = RGBA8::fromCode(color);
    out.clears_background = clears;
    out.source = source;
    return out;
}

// Function-local statics avoid global constructors.
const Recipe &basicRecipe() {
    static const Recipe recipe = {HalftoneMode::kBasic, "basic",
                                  {layer(0.0f, 0x000000, true)}};
    return recipe;
}

const Recipe &duotoneRecipe() {
    static const Recipe recipe = {
        HalftoneMode::kDuotone,
        "duotone",
        {layer(15.0f, 0x8B4513, true),
         layer(0.0f, 0x000000, false, LayerSource::kShadowMask)}};
    return recipe;
}

const Recipe &tritoneRecipe() {
    static const Recipe recipe = {HalftoneMode::kTritone,
                                  "tritone",
                                  {layer(0.0f, 0xFFD700, true),
                                   layer(30.0f, 0xFF6347, false),
                                   layer(60.0f, 0x000000, false)}};
    return recipe;
}

} // namespace

std::vector<RGBA8> Recipe::defaultColors() const {
    std::vector<RGBA8> colors;
    for (size i = 0; i < layers.size(); ++i) {
        colors.push_back(layers[i].default_color);
    }
    return colors;
}

bool Recipe::needsShadowMask() const {
    for (size i = 0; i < layers.size(); ++i) {
        if (layers[i].source == LayerSource::kShadowMask) {
            return true;
        }
    }
    return false;
}

const Recipe &recipeFor(HalftoneMode mode) {
    switch (mode) {
    case HalftoneMode::kDuotone:
        return duotoneRecipe();
    case HalftoneMode::kTritone:
        return tritoneRecipe();
    case HalftoneMode::kBasic:
    default:
        return basicRecipe();
    }
}

bool isKnownMode(HalftoneMode mode) {
    switch (mode) {
    case HalftoneMode::kBasic:
    case HalftoneMode::kDuotone:
    case HalftoneMode::kTritone:
        return true;
    }
    return false;
}

const char *toString(HalftoneMode mode) {
    if (!isKnownMode(mode)) {
        return "unknown";
    }
    return recipeFor(mode).name;
}

Result<HalftoneMode> parseMode(const std::string &name) {
    const HalftoneMode modes[] = {HalftoneMode::kBasic, HalftoneMode::kDuotone,
                                  HalftoneMode::kTritone};
    for (size i = 0; i < sizeof(modes) / sizeof(modes[0]); ++i) {
        if (name == recipeFor(modes[i]).name) {
            return Result<HalftoneMode>::success(modes[i]);
        }
    }
    return Result<HalftoneMode>::failure(ResultError::INVALID_ARGUMENT,
                                         "unknown halftone mode '" + name +
                                             "'");
}

} // namespace ht
