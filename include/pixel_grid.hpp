#pragma once

#include "color_space.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

/// Half-open pixel rectangle [x0, x1) x [y0, y1)
struct Rect {
    int x0 = 0, y0 = 0, x1 = 0, y1 = 0;

    int width() const { return x1 - x0; }
    int height() const { return y1 - y0; }
    bool empty() const { return x1 <= x0 || y1 <= y0; }
};

/// RGBA raster with rows packed as width * 4 bytes
class PixelGrid {
public:
    PixelGrid() = default;

    /// Opaque black grid
    PixelGrid(int width, int height);

    /// Grid filled with `fill`
    PixelGrid(int width, int height, const Rgba& fill);

    /// Copy an external RGBA buffer. Throws UnsupportedLayoutError if
    /// `stride` is not width * 4.
    static PixelGrid from_rgba(const uint8_t* data, int width, int height, int stride);

    int width() const { return width_; }
    int height() const { return height_; }
    int stride() const { return width_ * 4; }
    bool empty() const { return width_ <= 0 || height_ <= 0; }

    Rgba at(int x, int y) const;
    void set(int x, int y, const Rgba& c);

    const uint8_t* data() const { return pixels_.data(); }

private:
    size_t offset(int x, int y) const { return ((size_t)y * width_ + x) * 4; }

    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};
