#pragma once

#include "view_state.hpp"

struct PlanePoint {
    double re = 0.0;
    double im = 0.0;
};

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

// Pixel (px, py) to complex plane. Row 0 is the top of the surface and maps
// to bounds.ymax. Returns OutOfBounds outside [0,width) x [0,height) and
// leaves `out` untouched.
ViewError pixel_to_complex(double px, double py, const Viewport& vp, PlanePoint& out);

// Exact inverse of pixel_to_complex. Points outside the bounds map to pixels
// outside the surface; no range check.
PixelPoint complex_to_pixel(double re, double im, const Viewport& vp);

// Keep the center and x-range, derive the y-range from the new pixel aspect
// and store the new pixel size. On error `vp` is unchanged.
ViewError fit_aspect_ratio(Viewport& vp, int new_width, int new_height);
