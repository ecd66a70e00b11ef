#pragma once

#include "color_distance.hpp"
#include <array>
#include <cstddef>

static const size_t PALETTE_SIZE = 16;

/// C64 colors, according to http://hitmen.c02.at/temp/palstuff/
static const std::array<Rgba, PALETTE_SIZE> C64_PALETTE = {{
    {0x00, 0x00, 0x00, 0xFF},  //  0: black
    {0xFF, 0xFF, 0xFF, 0xFF},  //  1: white
    {0x67, 0x37, 0x2B, 0xFF},  //  2: red
    {0x6F, 0xA3, 0xB1, 0xFF},  //  3: cyan
    {0x6F, 0x3C, 0x85, 0xFF},  //  4: purple
    {0x58, 0x8C, 0x43, 0xFF},  //  5: green
    {0x34, 0x28, 0x79, 0xFF},  //  6: blue
    {0xB7, 0xC6, 0x6E, 0xFF},  //  7: yellow
    {0x6F, 0x4F, 0x25, 0xFF},  //  8: orange
    {0x42, 0x39, 0x00, 0xFF},  //  9: brown
    {0x99, 0x66, 0x59, 0xFF},  // 10: light red
    {0x43, 0x43, 0x43, 0xFF},  // 11: dark grey
    {0x6B, 0x6B, 0x6B, 0xFF},  // 12: grey
    {0x9A, 0xD1, 0x83, 0xFF},  // 13: light green
    {0x6B, 0x5E, 0xB4, 0xFF},  // 14: light blue
    {0x95, 0x95, 0x95, 0xFF},  // 15: light grey
}};

/// Human-readable name of a C64 palette index, "?" when out of range
const char* color_name(size_t index);

/// C64 palette with the Lab value of every entry computed once.
/// Immutable after construction, so one instance can be shared by
/// concurrent conversions.
class Palette {
public:
    Palette();

    /// Process-wide instance, built on first use
    static const Palette& c64();

    const Rgba& rgb(size_t index) const { return colors_[index].rgb; }
    const Lab& lab(size_t index) const { return colors_[index].lab; }
    size_t size() const { return colors_.size(); }

    /// Distance between palette entry `index` and `sample`
    double distance(size_t index, const BlockColor& sample, Metric metric) const;

    /// Index of the closest entry; the lowest index wins ties
    size_t closest(const BlockColor& sample, Metric metric) const;

private:
    std::array<BlockColor, PALETTE_SIZE> colors_;
};
