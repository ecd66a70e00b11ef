#pragma once

#include "pixel_grid.hpp"
#include <cstdint>
#include <string>
#include <vector>

/// Load an image file (any format stb_image decodes) as RGBA.
/// Throws ImageIoError when the file cannot be decoded.
PixelGrid load_image(const std::string& path);

/// Decode an in-memory encoded image as RGBA
PixelGrid decode_image(const std::vector<uint8_t>& bytes);

/// Write `grid` as an 8-bit RGBA PNG
void save_png(const PixelGrid& grid, const std::string& path);
