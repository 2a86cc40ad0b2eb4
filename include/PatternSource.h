/**
 * @file PatternSource.h
 * @brief Built-in animated test image so the layout always has a changing raster to follow.
 */
#pragma once

#include "Raster.h"

/**
 * @brief Redraw @p out (keeping its size) at time @p tSeconds: a diagonal colour gradient,
 *        two orbiting bright discs and a slowly drifting band.
 */
void renderPattern(Raster& out, double tSeconds);
