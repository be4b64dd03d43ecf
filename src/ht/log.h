#pragma once

#include "ht/dbg.h"
#include "ht/warn.h"

/// @file ht/log.h
/// @brief Logging categories for the halftone engine
///
/// Each category can be enabled at compile time by defining
/// HALFTONE_LOG_<CATEGORY>_ENABLED; disabled categories produce no output.
///
/// Example:
///   #define HALFTONE_LOG_ENGINE_ENABLED
///   #include "ht/log.h"
///
///   HT_LOG_ENGINE("converted " << width << "x" << height);

/// @brief Per-call conversion summaries (recipe, layers, dot counts)
#ifdef HALFTONE_LOG_ENGINE_ENABLED
#define HT_LOG_ENGINE(X) HT_WARN(X)
#else
#define HT_LOG_ENGINE(X) HT_DBG_NO_OP(X)
#endif

/// @brief Per-layer raster passes (bounds, coverage raster size)
#ifdef HALFTONE_LOG_RASTER_ENABLED
#define HT_LOG_RASTER(X) HT_WARN(X)
#else
#define HT_LOG_RASTER(X) HT_DBG_NO_OP(X)
#endif
