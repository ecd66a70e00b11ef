#include "block_average.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

static std::string rect_str(const Rect& r) {
    return "(" + std::to_string(r.x0) + "," + std::to_string(r.y0) + ")-(" +
           std::to_string(r.x1) + "," + std::to_string(r.y1) + ")";
}

BlockColor average_block(const PixelGrid& grid, const Rect& rect) {
    if (rect.empty()) {
        throw DegenerateBlockError("Empty block " + rect_str(rect));
    }
    if (rect.x0 < 0 || rect.y0 < 0 || rect.x1 > grid.width() || rect.y1 > grid.height()) {
        throw OutOfBoundsError("Block " + rect_str(rect) + " outside " +
                               std::to_string(grid.width()) + "x" +
                               std::to_string(grid.height()) + " image");
    }

    double sum_l = 0, sum_a = 0, sum_b = 0;
    double sum_r = 0, sum_g = 0, sum_bl = 0;
    for (int y = rect.y0; y < rect.y1; y++) {
        for (int x = rect.x0; x < rect.x1; x++) {
            Rgba c = premultiply(grid.at(x, y));
            Lab lab = rgb_to_lab(c);
            sum_l += lab.l;
            sum_a += lab.a;
            sum_b += lab.b;
            sum_r += c.r;
            sum_g += c.g;
            sum_bl += c.b;
        }
    }

    double count = (double)rect.width() * rect.height();

    BlockColor result;
    result.lab = {sum_l / count, sum_a / count, sum_b / count};
    result.rgb = {(uint8_t)(sum_r / count), (uint8_t)(sum_g / count), (uint8_t)(sum_bl / count), 255};
    return result;
}

Rect clamp_rect(const Rect& rect, int width, int height) {
    if (width <= 0 || height <= 0) {
        throw DegenerateBlockError("Cannot clamp into empty " + std::to_string(width) +
                                   "x" + std::to_string(height) + " image");
    }
    Rect r;
    r.x0 = std::clamp(rect.x0, 0, width - 1);
    r.y0 = std::clamp(rect.y0, 0, height - 1);
    r.x1 = std::clamp(rect.x1, r.x0 + 1, width);
    r.y1 = std::clamp(rect.y1, r.y0 + 1, height);
    return r;
}
