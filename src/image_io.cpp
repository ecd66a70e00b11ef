#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"
#include "image_io.hpp"
#include "errors.hpp"
#include <climits>
#include <exception>
#include <string>

static PixelGrid take_rgba(unsigned char* data, int w, int h, const std::string& source) {
    if (!data) {
        throw ImageIoError("Failed to load image: " + source +
                           " (" + stbi_failure_reason() + ")");
    }
    try {
        PixelGrid grid = PixelGrid::from_rgba(data, w, h, w * 4);
        stbi_image_free(data);
        return grid;
    } catch (const std::exception&) {
        stbi_image_free(data);
        throw;
    }
}

PixelGrid load_image(const std::string& path) {
    int w, h, channels;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);  // Force RGBA
    return take_rgba(data, w, h, path);
}

PixelGrid decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty() || bytes.size() > (size_t)INT_MAX) {
        throw ImageIoError("Failed to decode image: invalid buffer size " +
                           std::to_string(bytes.size()));
    }
    int w, h, channels;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(),
                                                &w, &h, &channels, 4);
    return take_rgba(data, w, h, "<memory>");
}

void save_png(const PixelGrid& grid, const std::string& path) {
    if (grid.empty()) {
        throw ImageIoError("Refusing to write empty image: " + path);
    }
    int ok = stbi_write_png(path.c_str(), grid.width(), grid.height(), 4,
                            grid.data(), grid.stride());
    if (!ok) {
        throw ImageIoError("Failed to write image: " + path);
    }
}
