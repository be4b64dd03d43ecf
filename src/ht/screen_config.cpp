#include "ht/screen_config.h"

#include <cmath>

#include <sstream>

namespace ht {

Result<void, HalftoneError> ScreenConfig::validate(const char *what) const {
    typedef Result<void, HalftoneError> R;
    std::ostringstream msg;
    msg << what << ": ";
    if (dot_resolution <= 0) {
        msg << "dot_resolution must be >= 1, got " << dot_resolution;
        return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
    }
    if (!std::isfinite(dot_size) || dot_size < 0.0f) {
        msg << "dot_size must be a finite value >= 0, got " << dot_size;
        return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
    }
    if (!std::isfinite(angle)) {
        msg << "angle must be finite";
        return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
    }
    if (!isKnownAnchorStrategy(anchor)) {
        msg << "unsupported anchor strategy " << static_cast<int>(anchor);
        return R::failure(HalftoneError::INVALID_PARAMETER, msg.str());
    }
    return R::success();
}

std::string ScreenConfig::toString() const {
    std::ostringstream out;
    out << "ScreenConfig(angle=" << angle << ", dot_size=" << dot_size
        << ", dot_resolution=" << dot_resolution << ", color=" << color.toHex()
        << ", invert=" << (invert ? "true" : "false")
        << ", anchor=" << ht::toString(anchor) << ")";
    return out.str();
}

} // namespace ht
