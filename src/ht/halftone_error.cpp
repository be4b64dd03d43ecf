#include "ht/halftone_error.h"

namespace ht {

const char *toString(HalftoneError error) {
    switch (error) {
    case HalftoneError::OK:
        return "OK";
    case HalftoneError::INVALID_PARAMETER:
        return "INVALID_PARAMETER";
    case HalftoneError::SOURCE_IMAGE_MISSING:
        return "SOURCE_IMAGE_MISSING";
    case HalftoneError::CANCELLED:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

} // namespace ht
