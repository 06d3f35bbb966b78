#include "coord_mapper.hpp"

#include <gtest/gtest.h>

static Viewport home_viewport(int w, int h)
{
    Viewport vp;
    vp.bounds = home_bounds();
    EXPECT_EQ(fit_aspect_ratio(vp, w, h), ViewError::None);
    return vp;
}

TEST(CoordMapper, TopLeftPixelMapsToXminYmax)
{
    const Viewport vp = home_viewport(800, 450);
    PlanePoint p;
    ASSERT_EQ(pixel_to_complex(0.0, 0.0, vp, p), ViewError::None);
    EXPECT_DOUBLE_EQ(p.re, vp.bounds.xmin);
    EXPECT_DOUBLE_EQ(p.im, vp.bounds.ymax);
}

TEST(CoordMapper, CenterPixelMapsToCenter)
{
    const Viewport vp = home_viewport(800, 450);
    PlanePoint p;
    ASSERT_EQ(pixel_to_complex(400.0, 225.0, vp, p), ViewError::None);
    EXPECT_NEAR(p.re, vp.bounds.center_x(), 1e-12);
    EXPECT_NEAR(p.im, vp.bounds.center_y(), 1e-12);
}

TEST(CoordMapper, RoundTrip)
{
    const Viewport vp = home_viewport(1024, 768);
    const double pts[][2] = {{-0.75, 0.1}, {0.3, -0.6}, {-2.0, 0.9}, {1.2, -1.1}};
    for (const auto& q : pts) {
        const PixelPoint px = complex_to_pixel(q[0], q[1], vp);
        PlanePoint back;
        ASSERT_EQ(pixel_to_complex(px.x, px.y, vp, back), ViewError::None);
        EXPECT_NEAR(back.re, q[0], 1e-12);
        EXPECT_NEAR(back.im, q[1], 1e-12);
    }
}

TEST(CoordMapper, OutsideSurfaceIsOutOfBounds)
{
    const Viewport vp = home_viewport(800, 450);
    PlanePoint p;
    p.re = 42.0;
    EXPECT_EQ(pixel_to_complex(800.0, 10.0, vp, p), ViewError::OutOfBounds);
    EXPECT_EQ(pixel_to_complex(-0.5, 10.0, vp, p), ViewError::OutOfBounds);
    EXPECT_EQ(pixel_to_complex(10.0, 450.0, vp, p), ViewError::OutOfBounds);
    EXPECT_EQ(pixel_to_complex(10.0, -1.0, vp, p), ViewError::OutOfBounds);
    EXPECT_DOUBLE_EQ(p.re, 42.0);
}

TEST(CoordMapper, FitAspectKeepsCenterAndXRange)
{
    Viewport vp = home_viewport(800, 450);
    const double cx = vp.bounds.center_x();
    const double cy = vp.bounds.center_y();
    const double xr = vp.bounds.width();

    const int sizes[][2] = {{1920, 1080}, {300, 900}, {1, 1}, {4000, 17}};
    for (const auto& s : sizes) {
        ASSERT_EQ(fit_aspect_ratio(vp, s[0], s[1]), ViewError::None);
        EXPECT_EQ(vp.pixel_width, s[0]);
        EXPECT_EQ(vp.pixel_height, s[1]);
        EXPECT_NEAR(vp.bounds.center_x(), cx, 1e-12);
        EXPECT_NEAR(vp.bounds.center_y(), cy, 1e-12);
        EXPECT_NEAR(vp.bounds.width(), xr, 1e-12);
        const double aspect_plane  = vp.bounds.width() / vp.bounds.height();
        const double aspect_pixels = static_cast<double>(s[0]) / s[1];
        EXPECT_NEAR(aspect_plane / aspect_pixels, 1.0, 1e-9);
    }
}

TEST(CoordMapper, FitAspectRejectsBadSize)
{
    Viewport vp = home_viewport(800, 450);
    const Viewport before = vp;
    EXPECT_EQ(fit_aspect_ratio(vp, 0, 450), ViewError::InvalidViewport);
    EXPECT_EQ(fit_aspect_ratio(vp, 800, -3), ViewError::InvalidViewport);
    EXPECT_EQ(vp.bounds, before.bounds);
    EXPECT_EQ(vp.pixel_width, 800);
    EXPECT_EQ(vp.pixel_height, 450);
}

TEST(CoordMapper, DegenerateBoundsRejected)
{
    Viewport vp;
    vp.bounds.xmax = vp.bounds.xmin;
    PlanePoint p;
    EXPECT_EQ(pixel_to_complex(1.0, 1.0, vp, p), ViewError::InvalidViewport);
    EXPECT_EQ(fit_aspect_ratio(vp, 100, 100), ViewError::InvalidViewport);
}
