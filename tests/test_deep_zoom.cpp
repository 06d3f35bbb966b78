#include "deep_zoom.hpp"

#include <gtest/gtest.h>

TEST(IterationEstimate, IdentityUpToZoomOne)
{
    const double zooms[] = {1e-6, 0.01, 0.5, 0.999, 1.0};
    for (double z : zooms) {
        EXPECT_EQ(estimate_iterations(z, 500), 500);
        EXPECT_EQ(estimate_iterations(z, 73), 73);
    }
}

TEST(IterationEstimate, GrowsWithLogOfZoom)
{
    // floor(500 * log10(11) + 500)
    EXPECT_EQ(estimate_iterations(10.0, 500), 1020);
    EXPECT_EQ(estimate_iterations(16.0, 500), 1115);
}

TEST(IterationEstimate, MonotoneAndCapped)
{
    int prev = estimate_iterations(1.0, 500);
    for (double z = 1.5; z < 1e300; z *= 3.7) {
        const int n = estimate_iterations(z, 500);
        EXPECT_GE(n, prev) << "zoom " << z;
        EXPECT_LE(n, DEFAULT_ITERATION_CAP);
        prev = n;
    }
    EXPECT_EQ(estimate_iterations(1e300, 500), DEFAULT_ITERATION_CAP);
    EXPECT_EQ(estimate_iterations(1e6, 500, 2000), 2000);
}

TEST(PrecisionInfo, HomeZoomIsComfortable)
{
    const PrecisionInfo pi = precision_info(1.0);
    EXPECT_EQ(pi.decimal_digits_needed, 2);
    EXPECT_FALSE(pi.warning);
    EXPECT_EQ(pi.max_digits, DOUBLE_MAX_DIGITS);
}

TEST(PrecisionInfo, WarnsNearDoubleLimit)
{
    EXPECT_FALSE(precision_info(5e10).warning);   // 12 digits, exactly 80%
    EXPECT_TRUE(precision_info(1e13).warning);
    const PrecisionInfo deep = precision_info(1e16);
    EXPECT_TRUE(deep.warning);
    EXPECT_DOUBLE_EQ(deep.percent_of_budget, 100.0);
}

TEST(PrecisionInfo, ZoomOutClampsToOne)
{
    const PrecisionInfo pi = precision_info(0.001);
    EXPECT_EQ(pi.decimal_digits_needed, 2);
    EXPECT_FALSE(pi.warning);
}

TEST(ColorBanding, StepsWithZoomDepth)
{
    struct Case { double zoom, stripe, cycle; };
    const Case cases[] = {
        {1.0,    16.0, 32.0},
        {9.99,   16.0, 32.0},
        {10.0,   20.0, 48.0},
        {99.0,   20.0, 48.0},
        {100.0,  24.0, 64.0},
        {999.0,  24.0, 64.0},
        {1000.0, 32.0, 96.0},
        {1e12,   32.0, 96.0},
    };
    for (const Case& c : cases) {
        const ColorBanding cb = color_banding_for_zoom(c.zoom);
        EXPECT_DOUBLE_EQ(cb.stripe_density, c.stripe) << "zoom " << c.zoom;
        EXPECT_DOUBLE_EQ(cb.cycle_density,  c.cycle)  << "zoom " << c.zoom;
    }
}
