#include "coord_mapper.hpp"

ViewError pixel_to_complex(double px, double py, const Viewport& vp, PlanePoint& out)
{
    const int W = vp.pixel_width;
    const int H = vp.pixel_height;
    if (W <= 0 || H <= 0 || !bounds_valid(vp.bounds))
        return ViewError::InvalidViewport;
    if (!(px >= 0.0 && px < W) || !(py >= 0.0 && py < H))
        return ViewError::OutOfBounds;

    const double nx = px / W;
    const double ny = 1.0 - py / H;
    out.re = vp.bounds.xmin + nx * vp.bounds.width();
    out.im = vp.bounds.ymin + ny * vp.bounds.height();
    return ViewError::None;
}

PixelPoint complex_to_pixel(double re, double im, const Viewport& vp)
{
    const double nx = (re - vp.bounds.xmin) / vp.bounds.width();
    const double ny = (im - vp.bounds.ymin) / vp.bounds.height();
    return { nx * vp.pixel_width, (1.0 - ny) * vp.pixel_height };
}

ViewError fit_aspect_ratio(Viewport& vp, int new_width, int new_height)
{
    if (new_width <= 0 || new_height <= 0 || !bounds_valid(vp.bounds))
        return ViewError::InvalidViewport;

    const double cy      = vp.bounds.center_y();
    const double x_range = vp.bounds.width();
    const double y_range = x_range * static_cast<double>(new_height) / new_width;

    // x extent is kept verbatim, so the center stays exact
    Bounds nb;
    nb.xmin = vp.bounds.xmin;
    nb.xmax = vp.bounds.xmax;
    nb.ymin = cy - y_range * 0.5;
    nb.ymax = cy + y_range * 0.5;
    if (!bounds_valid(nb))
        return ViewError::InvalidViewport;

    vp.bounds       = nb;
    vp.pixel_width  = new_width;
    vp.pixel_height = new_height;
    return ViewError::None;
}
