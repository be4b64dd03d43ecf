#include "ht/anchor_strategy.h"

namespace ht {

vec2f anchorPoint(AnchorStrategy strategy, const vec2f &grid_point,
                  const vec2f &sample_point) {
    switch (strategy) {
    case AnchorStrategy::kLegacy:
        return sample_point;
    case AnchorStrategy::kTraditional:
    default:
        return grid_point;
    }
}

bool isKnownAnchorStrategy(AnchorStrategy strategy) {
    switch (strategy) {
    case AnchorStrategy::kTraditional:
    case AnchorStrategy::kLegacy:
        return true;
    }
    return false;
}

const char *toString(AnchorStrategy strategy) {
    switch (strategy) {
    case AnchorStrategy::kTraditional:
        return "traditional";
    case AnchorStrategy::kLegacy:
        return "legacy";
    }
    return "unknown";
}

Result<AnchorStrategy> parseAnchorStrategy(const std::string &name) {
    if (name == "traditional") {
        return Result<AnchorStrategy>::success(AnchorStrategy::kTraditional);
    }
    if (name == "legacy") {
        return Result<AnchorStrategy>::success(AnchorStrategy::kLegacy);
    }
    return Result<AnchorStrategy>::failure(
        ResultError::INVALID_ARGUMENT,
        "unknown anchor strategy '" + name + "'");
}

} // namespace ht
