#include "ht/coverage_raster.h"

namespace ht {

u32 CoverageRaster::coveredPixels() const {
    u32 count = 0;
    const u8 *data = mGrid.data();
    for (size i = 0; i < mGrid.size(); ++i) {
        if (data[i] > 0) {
            ++count;
        }
    }
    return count;
}

} // namespace ht
