#include "color_space.hpp"
#include <algorithm>
#include <cmath>

// D65 reference white
static const double WHITE_X = 95.047;
static const double WHITE_Y = 100.0;
static const double WHITE_Z = 108.883;

static const double LAB_EPSILON = (24.0 / 116.0) * (24.0 / 116.0) * (24.0 / 116.0);
static const double LAB_KAPPA = 841.0 / 108.0;
static const double LAB_OFFSET = 16.0 / 116.0;

// --- Gamma ---

static double srgb_to_linear(uint8_t channel) {
    double v = channel / 255.0;
    if (v > 0.04045) {
        return std::pow((v + 0.055) / 1.055, 2.4);
    }
    return v / 12.92;
}

static uint8_t linear_to_srgb(double v) {
    if (v > 0.0031308) {
        v = 1.055 * std::pow(v, 1.0 / 2.4) - 0.055;
    } else {
        v = v * 12.92;
    }
    return static_cast<uint8_t>(std::clamp((int)std::round(v * 255.0), 0, 255));
}

// --- Lab nonlinearity ---

static double lab_f(double t) {
    if (t > LAB_EPSILON) {
        return std::pow(t, 1.0 / 3.0);
    }
    return LAB_KAPPA * t + LAB_OFFSET;
}

static double lab_f_inverse(double t) {
    if (t > 24.0 / 116.0) {
        return t * t * t;
    }
    return (t - LAB_OFFSET) / LAB_KAPPA;
}

Rgba premultiply(const Rgba& c) {
    return {
        static_cast<uint8_t>(c.r * c.a / 255),
        static_cast<uint8_t>(c.g * c.a / 255),
        static_cast<uint8_t>(c.b * c.a / 255),
        255,
    };
}

Xyz rgb_to_xyz(const Rgba& c) {
    double r = srgb_to_linear(c.r) * 100.0;
    double g = srgb_to_linear(c.g) * 100.0;
    double b = srgb_to_linear(c.b) * 100.0;

    return {
        0.4124564 * r + 0.3575761 * g + 0.1804375 * b,
        0.2126729 * r + 0.7151522 * g + 0.0721750 * b,
        0.0193339 * r + 0.1191920 * g + 0.9503041 * b,
    };
}

Lab xyz_to_lab(const Xyz& c) {
    double fx = lab_f(c.x / WHITE_X);
    double fy = lab_f(c.y / WHITE_Y);
    double fz = lab_f(c.z / WHITE_Z);

    return {
        116.0 * fy - 16.0,
        500.0 * (fx - fy),
        200.0 * (fy - fz),
    };
}

Lab rgb_to_lab(const Rgba& c) {
    return xyz_to_lab(rgb_to_xyz(c));
}

Xyz lab_to_xyz(const Lab& c) {
    double fy = (c.l + 16.0) / 116.0;
    double fx = fy + c.a / 500.0;
    double fz = fy - c.b / 200.0;

    return {
        WHITE_X * lab_f_inverse(fx),
        WHITE_Y * lab_f_inverse(fy),
        WHITE_Z * lab_f_inverse(fz),
    };
}

Rgba xyz_to_rgb(const Xyz& c) {
    double x = c.x / 100.0;
    double y = c.y / 100.0;
    double z = c.z / 100.0;

    double r =  3.2404542 * x - 1.5371385 * y - 0.4985314 * z;
    double g = -0.9692660 * x + 1.8760108 * y + 0.0415560 * z;
    double b =  0.0556434 * x - 0.2040259 * y + 1.0572252 * z;

    return {linear_to_srgb(r), linear_to_srgb(g), linear_to_srgb(b), 255};
}

Rgba lab_to_rgb(const Lab& c) {
    return xyz_to_rgb(lab_to_xyz(c));
}
