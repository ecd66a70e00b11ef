#include "pixel_grid.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>

PixelGrid::PixelGrid(int width, int height)
    : PixelGrid(width, height, Rgba{0, 0, 0, 255}) {}

PixelGrid::PixelGrid(int width, int height, const Rgba& fill) {
    if (width < 0 || height < 0) {
        throw UnsupportedLayoutError("Negative grid size: " + std::to_string(width) +
                                     "x" + std::to_string(height));
    }
    width_ = width;
    height_ = height;
    pixels_.resize((size_t)width * height * 4);
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i + 0] = fill.r;
        pixels_[i + 1] = fill.g;
        pixels_[i + 2] = fill.b;
        pixels_[i + 3] = fill.a;
    }
}

PixelGrid PixelGrid::from_rgba(const uint8_t* data, int width, int height, int stride) {
    if (stride != width * 4) {
        throw UnsupportedLayoutError("Unsupported stride " + std::to_string(stride) +
                                     " for width " + std::to_string(width) +
                                     " (expected " + std::to_string(width * 4) + ")");
    }
    PixelGrid grid(width, height);
    if (!grid.pixels_.empty()) {
        std::memcpy(grid.pixels_.data(), data, grid.pixels_.size());
    }
    return grid;
}

Rgba PixelGrid::at(int x, int y) const {
    const uint8_t* p = &pixels_[offset(x, y)];
    return {p[0], p[1], p[2], p[3]};
}

void PixelGrid::set(int x, int y, const Rgba& c) {
    uint8_t* p = &pixels_[offset(x, y)];
    p[0] = c.r;
    p[1] = c.g;
    p[2] = c.b;
    p[3] = c.a;
}
