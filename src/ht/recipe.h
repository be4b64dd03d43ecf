#pragma once

#include <string>
#include <vector>

#include "ht/int.h"
#include "ht/result.h"
#include "ht/rgba8.h"

namespace ht {

enum class HalftoneMode : u8 {
    kBasic = 0,
    kDuotone,
    kTritone,
};

// Which image a layer samples.
enum class LayerSource : u8 {
    kOriginal = 0,
    kShadowMask, // deriveShadowMask() of the source image
};

// One layer of a recipe, relative to the user's screen angle.
struct RecipeLayer {
    float angle_offset;
    RGBA8 default_color;
    bool clears_background;
    LayerSource source;
};

// A recipe is pure data: the engine expands it into a HalftoneJob without
// any per-recipe code.
struct Recipe {
    HalftoneMode mode;
    const char *name;
    std::vector<RecipeLayer> layers;

    size colorCount() const { return layers.size(); }
    std::vector<RGBA8> defaultColors() const;
    bool needsShadowMask() const;
};

//  basic:   [+0  user color, clears]
//  duotone: [+15 #8B4513, clears], [+0 #000000, shadow mask]
//  tritone: [+0 #FFD700, clears], [+30 #FF6347], [+60 #000000]
const Recipe &recipeFor(HalftoneMode mode);

bool isKnownMode(HalftoneMode mode);

const char *toString(HalftoneMode mode);

// "basic" | "duotone" | "tritone"
Result<HalftoneMode> parseMode(const std::string &name);

} // namespace ht
