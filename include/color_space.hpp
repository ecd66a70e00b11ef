#pragma once

#include <cstdint>

/// 8-bit RGBA color
struct Rgba {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

/// CIE XYZ, Y scaled to [0,100]
struct Xyz {
    double x = 0, y = 0, z = 0;
};

/// CIE L*a*b* (D65)
struct Lab {
    double l = 0, a = 0, b = 0;
};

/// Composite onto black: each channel scaled by alpha, result opaque
Rgba premultiply(const Rgba& c);

/// sRGB -> XYZ (gamma expansion followed by the D65 sRGB matrix)
Xyz rgb_to_xyz(const Rgba& c);

/// XYZ -> L*a*b* relative to the D65 white point
Lab xyz_to_lab(const Xyz& c);

Lab rgb_to_lab(const Rgba& c);

/// Inverse of xyz_to_lab
Xyz lab_to_xyz(const Lab& c);

/// XYZ -> sRGB, rounded and clamped to 8 bits, alpha 255
Rgba xyz_to_rgb(const Xyz& c);

/// Approximate inverse of rgb_to_lab
Rgba lab_to_rgb(const Lab& c);
