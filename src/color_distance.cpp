#include "color_distance.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

static const double PI = 3.14159265358979323846;
static const double DEG2RAD = PI / 180.0;
static const double RAD2DEG = 180.0 / PI;

static bool almost_zero(double x) {
    return std::fabs(x) < 1e-8;
}

static double sq(double x) {
    return x * x;
}

const char* metric_name(Metric metric) {
    switch (metric) {
        case Metric::Rgb: return "RGB";
        case Metric::Cie76: return "CIE76";
        case Metric::Cie94: return "CIE94";
        case Metric::Cie2000: return "CIE2000";
    }
    return "UNKNOWN";
}

Metric parse_metric(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch) { return (char)std::toupper(ch); });
    for (Metric m : ALL_METRICS) {
        if (upper == metric_name(m)) {
            return m;
        }
    }
    throw std::invalid_argument("Unknown metric: " + name);
}

BlockColor make_block_color(const Rgba& c) {
    return {rgb_to_lab(c), c};
}

double rgb_distance(const Rgba& c1, const Rgba& c2) {
    double dr = (double)c1.r - c2.r;
    double dg = (double)c1.g - c2.g;
    double db = (double)c1.b - c2.b;
    return dr * dr + dg * dg + db * db;
}

double cie76_distance(const Lab& c1, const Lab& c2) {
    return sq(c2.l - c1.l) + sq(c2.a - c1.a) + sq(c2.b - c1.b);
}

double cie94_distance(const Lab& c1, const Lab& c2) {
    double chroma1 = std::sqrt(c1.a * c1.a + c1.b * c1.b);
    double chroma2 = std::sqrt(c2.a * c2.a + c2.b * c2.b);
    double dl = c2.l - c1.l;
    double dc = chroma2 - chroma1;

    // dH^2 = dE^2 - dL^2 - dC^2, can dip below zero through rounding
    double dh = cie76_distance(c1, c2) - dl * dl - dc * dc;
    dh = dh > 0.0 ? std::sqrt(dh) : 0.0;

    const double sl = 1.0;
    double sc = 1.0 + 0.045 * chroma1;
    double sh = 1.0 + 0.015 * chroma1;

    return sq(dl / sl) + sq(dc / sc) + sq(dh / sh);
}

/// Hue angle in [0, 360)
static double hue_degrees(double a, double b) {
    double h = std::atan2(b, a) * RAD2DEG;
    return h < 0.0 ? h + 360.0 : h;
}

double cie2000_distance(const Lab& c1, const Lab& c2) {
    double chroma_mean = (std::sqrt(c1.a * c1.a + c1.b * c1.b) +
                          std::sqrt(c2.a * c2.a + c2.b * c2.b)) / 2.0;
    double chroma_mean7 = std::pow(chroma_mean, 7.0);
    double g = 0.5 * (1.0 - std::sqrt(chroma_mean7 / (chroma_mean7 + std::pow(25.0, 7.0))));

    // a' rescaled by G, then C' and h'
    double a1 = (1.0 + g) * c1.a;
    double a2 = (1.0 + g) * c2.a;
    double chroma1 = std::sqrt(a1 * a1 + c1.b * c1.b);
    double chroma2 = std::sqrt(a2 * a2 + c2.b * c2.b);
    double hue1 = hue_degrees(a1, c1.b);
    double hue2 = hue_degrees(a2, c2.b);

    double dl = c2.l - c1.l;
    double dc = chroma2 - chroma1;
    bool achromatic = almost_zero(chroma1 * chroma2);

    double dhue = 0.0;
    if (!achromatic) {
        dhue = hue2 - hue1;
        if (dhue > 180.0) {
            dhue -= 360.0;
        } else if (dhue < -180.0) {
            dhue += 360.0;
        }
    }
    double dh = 2.0 * std::sqrt(chroma1 * chroma2) * std::sin(DEG2RAD * (dhue / 2.0));

    double l_mean = (c1.l + c2.l) / 2.0;
    double c_mean = (chroma1 + chroma2) / 2.0;

    double h_mean;
    if (achromatic) {
        h_mean = hue1 + hue2;
    } else {
        h_mean = hue1 + hue2;
        if (std::fabs(hue1 - hue2) > 180.0) {
            h_mean += (h_mean < 360.0) ? 360.0 : -360.0;
        }
        h_mean /= 2.0;
    }

    double t = 1.0 - 0.17 * std::cos(DEG2RAD * (h_mean - 30.0)) +
               0.24 * std::cos(DEG2RAD * (2.0 * h_mean)) +
               0.32 * std::cos(DEG2RAD * (3.0 * h_mean + 6.0)) -
               0.20 * std::cos(DEG2RAD * (4.0 * h_mean - 63.0));
    double dtheta = 30.0 * std::exp(-sq((h_mean - 275.0) / 25.0));
    double c_mean7 = std::pow(c_mean, 7.0);
    double rc = 2.0 * std::sqrt(c_mean7 / (c_mean7 + std::pow(25.0, 7.0)));

    double l50 = sq(l_mean - 50.0);
    double sl = 1.0 + (0.015 * l50) / std::sqrt(20.0 + l50);
    double sc = 1.0 + 0.045 * c_mean;
    double sh = 1.0 + 0.015 * c_mean * t;
    double rt = -std::sin(DEG2RAD * 2.0 * dtheta) * rc;

    dl /= sl;
    dc /= sc;
    dh /= sh;

    return dl * dl + dc * dc + dh * dh + rt * dc * dh;
}

double color_distance(const BlockColor& c1, const BlockColor& c2, Metric metric) {
    switch (metric) {
        case Metric::Rgb: return rgb_distance(c1.rgb, c2.rgb);
        case Metric::Cie76: return cie76_distance(c1.lab, c2.lab);
        case Metric::Cie94: return cie94_distance(c1.lab, c2.lab);
        case Metric::Cie2000: return cie2000_distance(c1.lab, c2.lab);
    }
    throw std::invalid_argument("Unknown metric");
}
