#pragma once

#include <string>

#include "ht/geometry.h"
#include "ht/result.h"

namespace ht {

// Where a dot is centered once its cell has been sampled.
//
//  kTraditional: on the grid coordinate itself; only the luminance comes from
//                the inverse-rotated position.
//  kLegacy:      on the inverse-rotated (sampled) coordinate. Kept so output
//                can be compared against renders made before kTraditional.
enum class AnchorStrategy : u8 {
    kTraditional = 0,
    kLegacy,
};

// Picks the dot center for a cell. New strategies add an enum value and a
// case here; nothing else branches on the strategy.
vec2f anchorPoint(AnchorStrategy strategy, const vec2f &grid_point,
                  const vec2f &sample_point);

bool isKnownAnchorStrategy(AnchorStrategy strategy);

const char *toString(AnchorStrategy strategy);

// "traditional" | "legacy"
Result<AnchorStrategy> parseAnchorStrategy(const std::string &name);

} // namespace ht
