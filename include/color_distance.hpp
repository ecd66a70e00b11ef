#pragma once

#include "color_space.hpp"
#include <array>
#include <string>

/// Color difference formula used when matching against the palette
enum class Metric {
    Rgb,
    Cie76,
    Cie94,
    Cie2000,
};

static const std::array<Metric, 4> ALL_METRICS = {{
    Metric::Rgb,
    Metric::Cie76,
    Metric::Cie94,
    Metric::Cie2000,
}};

/// "RGB", "CIE76", "CIE94" or "CIE2000"
const char* metric_name(Metric metric);

/// Parse a metric name (case-insensitive). Throws std::invalid_argument.
Metric parse_metric(const std::string& name);

/// A color in both representations; RGB distance needs raw channels,
/// the CIE formulas need Lab.
struct BlockColor {
    Lab lab;
    Rgba rgb;
};

BlockColor make_block_color(const Rgba& c);

/// All distances below are squared: lower is closer, 0 for identical colors.

double rgb_distance(const Rgba& c1, const Rgba& c2);
double cie76_distance(const Lab& c1, const Lab& c2);
double cie94_distance(const Lab& c1, const Lab& c2);
double cie2000_distance(const Lab& c1, const Lab& c2);

/// Dispatch to one of the formulas above
double color_distance(const BlockColor& c1, const BlockColor& c2, Metric metric);
