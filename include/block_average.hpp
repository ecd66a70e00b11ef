#pragma once

#include "color_distance.hpp"
#include "pixel_grid.hpp"

/// Mean color of `rect`, averaged per pixel in Lab and in RGB.
/// Pixels are composited onto black first; the RGB mean is truncated to 8 bits.
/// Throws DegenerateBlockError for an empty rect and OutOfBoundsError
/// when the rect is not fully inside the grid.
BlockColor average_block(const PixelGrid& grid, const Rect& rect);

/// Clamp `rect` into a width x height grid, keeping at least one pixel
Rect clamp_rect(const Rect& rect, int width, int height);
