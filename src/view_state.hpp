#pragma once

#include <cmath>

// Rectangle of the complex plane currently on screen.
struct Bounds {
    double xmin = -2.6;
    double xmax =  1.845;
    double ymin = -1.25;
    double ymax =  1.25;

    double width()    const { return xmax - xmin; }
    double height()   const { return ymax - ymin; }
    double center_x() const { return (xmin + xmax) * 0.5; }
    double center_y() const { return (ymin + ymax) * 0.5; }
};

inline bool operator==(const Bounds& a, const Bounds& b)
{
    return a.xmin == b.xmin && a.xmax == b.xmax &&
           a.ymin == b.ymin && a.ymax == b.ymax;
}

inline bool operator!=(const Bounds& a, const Bounds& b) { return !(a == b); }

struct ColorParams {
    double stripe_density = 16.0;   // stripe-average frequency, 0 disables stripes
    double cycle_density  = 32.0;   // escape counts per full color cycle
    double stripe_sigma   = 0.9;    // stripe memory / contrast, 0..1
    double step_density   = 0.0;    // step shading frequency, 0 disables
    double rgb_thetas[3]  = {0.0, 0.15, 0.25};
};

enum class ViewError {
    None             = 0,
    InvalidViewport  = 1,  // non-positive pixel size, degenerate bounds, bad zoom factor
    OutOfBounds      = 2,  // pixel outside the current surface
    InvalidParameter = 3,
};

inline const char* view_error_str(ViewError e)
{
    switch (e) {
        case ViewError::None:             return "none";
        case ViewError::InvalidViewport:  return "invalid viewport";
        case ViewError::OutOfBounds:      return "out of bounds";
        case ViewError::InvalidParameter: return "invalid parameter";
    }
    return "unknown";
}

constexpr int    DEFAULT_BASE_ITERATIONS = 500;
constexpr int    DEFAULT_ITERATION_CAP   = 50000;
constexpr int    MAX_OVERSAMPLING        = 3;

struct Viewport {
    int         pixel_width    = 800;
    int         pixel_height   = 450;
    Bounds      bounds;
    double      zoom_level     = 1.0;
    int         max_iterations = DEFAULT_BASE_ITERATIONS;
    ColorParams color;
    int         oversampling   = 1;    // NxN supersampling per pixel
};

inline Bounds home_bounds()
{
    return Bounds{};
}

inline bool bounds_valid(const Bounds& b)
{
    return std::isfinite(b.xmin) && std::isfinite(b.xmax) &&
           std::isfinite(b.ymin) && std::isfinite(b.ymax) &&
           b.xmax > b.xmin && b.ymax > b.ymin;
}

// Structural invariants only; the aspect invariant is checked by the tests.
inline bool viewport_valid(const Viewport& vp, int iteration_cap = DEFAULT_ITERATION_CAP)
{
    return vp.pixel_width > 0 && vp.pixel_height > 0 &&
           bounds_valid(vp.bounds) &&
           vp.zoom_level > 0.0 && std::isfinite(vp.zoom_level) &&
           vp.max_iterations >= 1 && vp.max_iterations <= iteration_cap &&
           vp.oversampling >= 1 && vp.oversampling <= MAX_OVERSAMPLING;
}
