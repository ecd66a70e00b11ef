#pragma once

#include "color_distance.hpp"
#include "palette.hpp"
#include "pixel_grid.hpp"
#include <vector>

/// Output width of every conversion. Each C64 multicolor pixel covers two
/// output pixels, so the effective horizontal resolution is half of this.
static const int C64_WIDTH = 320;

/// Tallest output accepted; a 320 x 32768 RGBA grid is 40 MiB
static const int MAX_TARGET_HEIGHT = 32768;

struct TargetSize {
    int width;
    int height;
};

/// Output size for a width x height source: 320 wide, height scaled to
/// keep the source aspect ratio (rounded up). Throws DegenerateBlockError
/// for an empty source or when the height would exceed MAX_TARGET_HEIGHT.
TargetSize target_size(int width, int height);

/// Convert `source` to the C64 palette using `metric`.
/// Throws DegenerateBlockError for an empty source.
PixelGrid convert_image(const PixelGrid& source, Metric metric,
                        const Palette& palette = Palette::c64());

/// Run one conversion per metric in parallel; results are returned in the
/// order of `metrics`. Rethrows the first failure once every task finished.
std::vector<PixelGrid> convert_all(const PixelGrid& source,
                                   const std::vector<Metric>& metrics,
                                   const Palette& palette = Palette::c64());
