#include <gtest/gtest.h>

#include "color_distance.hpp"
#include "palette.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

static std::vector<Rgba> sample_colors() {
    std::vector<Rgba> colors(C64_PALETTE.begin(), C64_PALETTE.end());
    colors.push_back({10, 20, 30, 255});
    colors.push_back({200, 190, 180, 255});
    colors.push_back({255, 0, 0, 255});
    colors.push_back({0, 0, 255, 255});
    colors.push_back({128, 128, 127, 255});
    return colors;
}

TEST(ColorDistance, RgbRegressionValue) {
    EXPECT_DOUBLE_EQ(rgb_distance({10, 20, 30, 255}, {200, 190, 180, 255}), 87500.0);
}

TEST(ColorDistance, SelfDistanceIsZero) {
    for (const Rgba& c : sample_colors()) {
        BlockColor bc = make_block_color(c);
        for (Metric m : ALL_METRICS) {
            EXPECT_NEAR(color_distance(bc, bc, m), 0.0, 1e-12) << metric_name(m);
        }
    }
}

TEST(ColorDistance, Cie76UsesAllThreeAxes) {
    EXPECT_DOUBLE_EQ(cie76_distance({50, 0, 0}, {50, 0, 10}), 100.0);
    EXPECT_DOUBLE_EQ(cie76_distance({50, 3, 0}, {54, 0, 0}), 25.0);
}

TEST(ColorDistance, Cie94LightnessIsUnweighted) {
    EXPECT_NEAR(cie94_distance({50, 0, 0}, {60, 0, 0}), 100.0, 1e-9);
}

TEST(ColorDistance, Cie94ChromaFromNeutral) {
    // C1 = 0 so SC = 1 and the whole difference is chroma
    EXPECT_NEAR(cie94_distance({50, 0, 0}, {50, 0, 10}), 100.0, 1e-9);
}

TEST(ColorDistance, Cie94WeightsHueByFirstChroma) {
    // Same chroma, opposite hue: dC = 0, dH = 40, SH = 1 + 0.015 * 20
    double expected = (40.0 / 1.3) * (40.0 / 1.3);
    EXPECT_NEAR(cie94_distance({50, 20, 0}, {50, -20, 0}), expected, 1e-9);
}

// Reference pairs from Sharma, Wu and Dalal, "The CIEDE2000 color-difference formula"
TEST(ColorDistance, Cie2000ReferencePairs) {
    EXPECT_NEAR(std::sqrt(cie2000_distance({50.0, 2.6772, -79.7751}, {50.0, 0.0, -82.7485})), 2.0425, 1e-4);
    EXPECT_NEAR(std::sqrt(cie2000_distance({50.0, 0.0, 0.0}, {50.0, -1.0, 2.0})), 2.3669, 1e-4);
    EXPECT_NEAR(std::sqrt(cie2000_distance({50.0, -1.0, 2.0}, {50.0, 0.0, 0.0})), 2.3669, 1e-4);
    EXPECT_NEAR(std::sqrt(cie2000_distance({50.0, 2.5, 0.0}, {73.0, 25.0, -18.0})), 27.1492, 1e-4);
}

TEST(ColorDistance, Cie2000AchromaticPair) {
    // Both chromas zero: only lightness contributes
    // Mean lightness 50 makes SL = 1
    EXPECT_NEAR(cie2000_distance({40, 0, 0}, {60, 0, 0}), 400.0, 1e-9);
}

TEST(ColorDistance, PerceptualMetricsAreNonNegative) {
    std::vector<Rgba> colors = sample_colors();
    for (const Rgba& c1 : colors) {
        for (const Rgba& c2 : colors) {
            Lab l1 = rgb_to_lab(c1);
            Lab l2 = rgb_to_lab(c2);
            EXPECT_GE(cie94_distance(l1, l2), 0.0);
            EXPECT_GE(cie2000_distance(l1, l2), 0.0);
        }
    }
}

TEST(ColorDistance, Cie2000TracksCie94ForSmallDifferences) {
    const Lab offsets[] = {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}, {0.5, -0.5, 0.5}};
    for (int r = 0; r <= 255; r += 51) {
        for (int g = 0; g <= 255; g += 51) {
            for (int b = 0; b <= 255; b += 51) {
                Lab base = rgb_to_lab({(uint8_t)r, (uint8_t)g, (uint8_t)b, 255});
                for (const Lab& off : offsets) {
                    Lab near{base.l + off.l, base.a + off.a, base.b + off.b};
                    double ratio = std::sqrt(cie2000_distance(base, near)) /
                                   std::sqrt(cie94_distance(base, near));
                    EXPECT_GT(ratio, 0.4);
                    EXPECT_LT(ratio, 2.5);
                }
            }
        }
    }
}

TEST(ColorDistance, DispatchUsesRawRgbForRgbMetric) {
    BlockColor a = make_block_color({10, 20, 30, 255});
    BlockColor b = make_block_color({200, 190, 180, 255});
    EXPECT_DOUBLE_EQ(color_distance(a, b, Metric::Rgb), 87500.0);
    EXPECT_DOUBLE_EQ(color_distance(a, b, Metric::Cie76), cie76_distance(a.lab, b.lab));
    EXPECT_DOUBLE_EQ(color_distance(a, b, Metric::Cie94), cie94_distance(a.lab, b.lab));
    EXPECT_DOUBLE_EQ(color_distance(a, b, Metric::Cie2000), cie2000_distance(a.lab, b.lab));
}

TEST(ColorDistance, MetricNames) {
    for (Metric m : ALL_METRICS) {
        EXPECT_EQ(parse_metric(metric_name(m)), m);
    }
    EXPECT_EQ(parse_metric("cie2000"), Metric::Cie2000);
    EXPECT_EQ(parse_metric("Rgb"), Metric::Rgb);
    EXPECT_THROW(parse_metric("cie2001"), std::invalid_argument);
    EXPECT_THROW(parse_metric(""), std::invalid_argument);
}
