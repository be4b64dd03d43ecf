#pragma once

// Umbrella header for the halftone engine.

#include "ht/anchor_strategy.h"
#include "ht/downscale.h"
#include "ht/halftone_config.h"
#include "ht/halftone_engine.h"
#include "ht/halftone_error.h"
#include "ht/halftone_settings.h"
#include "ht/layer_compositor.h"
#include "ht/raster_image.h"
#include "ht/recipe.h"
#include "ht/rgba8.h"
#include "ht/screen_config.h"
#include "ht/shadow_mask.h"
