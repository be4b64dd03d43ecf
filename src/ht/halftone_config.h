#pragma once

// Compile-time defaults for the halftone engine. Every value can be
// overridden with a -D define on the compiler command line.

// Rasterization scale relative to the nominal output size. Layers of one job
// always share this factor so they align pixel for pixel.
#ifndef HALFTONE_DEFAULT_SUPERSAMPLE
#define HALFTONE_DEFAULT_SUPERSAMPLE 2
#endif

// Dots with a radius at or below this many output units are not drawn.
#ifndef HALFTONE_MIN_DOT_RADIUS
#define HALFTONE_MIN_DOT_RADIUS 0.1f
#endif

// Luminance split used by the duotone shadow mask.
#ifndef HALFTONE_SHADOW_THRESHOLD
#define HALFTONE_SHADOW_THRESHOLD 127
#endif

// Upper bound on layers in one job.
#ifndef HALFTONE_MAX_LAYERS
#define HALFTONE_MAX_LAYERS 3
#endif

// Dot sizes above this still render but log a warning.
#ifndef HALFTONE_MAX_RECOMMENDED_DOT_SIZE
#define HALFTONE_MAX_RECOMMENDED_DOT_SIZE 40
#endif

// Grid rows between two polls of the cancellation hook.
#ifndef HALFTONE_CANCEL_POLL_ROWS
#define HALFTONE_CANCEL_POLL_ROWS 1
#endif

// HalftoneSettings defaults.
#ifndef HALFTONE_DEFAULT_DOT_SIZE
#define HALFTONE_DEFAULT_DOT_SIZE 8
#endif

#ifndef HALFTONE_DEFAULT_DOT_RESOLUTION
#define HALFTONE_DEFAULT_DOT_RESOLUTION 5
#endif
