#include "palette.hpp"
#include <limits>
#include <stdexcept>
#include <string>

static const std::array<const char*, PALETTE_SIZE> COLOR_NAMES = {{
    "black", "white", "red", "cyan",
    "purple", "green", "blue", "yellow",
    "orange", "brown", "light red", "dark grey",
    "grey", "light green", "light blue", "light grey",
}};

const char* color_name(size_t index) {
    if (index >= COLOR_NAMES.size()) {
        return "?";
    }
    return COLOR_NAMES[index];
}

Palette::Palette() {
    for (size_t i = 0; i < PALETTE_SIZE; i++) {
        colors_[i] = make_block_color(C64_PALETTE[i]);
    }
}

const Palette& Palette::c64() {
    static const Palette instance;
    return instance;
}

double Palette::distance(size_t index, const BlockColor& sample, Metric metric) const {
    if (index >= colors_.size()) {
        throw std::out_of_range("Palette index out of range: " + std::to_string(index));
    }
    return color_distance(sample, colors_[index], metric);
}

size_t Palette::closest(const BlockColor& sample, Metric metric) const {
    size_t best_idx = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < colors_.size(); i++) {
        double dist = distance(i, sample, metric);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }
    return best_idx;
}
