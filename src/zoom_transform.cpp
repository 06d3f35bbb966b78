#include "zoom_transform.hpp"

#include <cmath>

ViewError zoom_at(Viewport& vp, double target_re, double target_im, double factor)
{
    if (!std::isfinite(factor) || factor <= 0.0 ||
        !std::isfinite(target_re) || !std::isfinite(target_im))
        return ViewError::InvalidViewport;
    if (vp.pixel_width <= 0 || vp.pixel_height <= 0 || !bounds_valid(vp.bounds))
        return ViewError::InvalidViewport;

    const double half_w = vp.bounds.width() * 0.5 * factor;
    const double half_h = half_w * static_cast<double>(vp.pixel_height) / vp.pixel_width;
    const double zoom   = vp.zoom_level / factor;

    Bounds nb;
    nb.xmin = target_re - half_w;
    nb.xmax = target_re + half_w;
    nb.ymin = target_im - half_h;
    nb.ymax = target_im + half_h;

    // Deep zooms eventually collapse the range below double resolution.
    if (!bounds_valid(nb) || !std::isfinite(zoom) || zoom <= 0.0)
        return ViewError::InvalidViewport;

    vp.bounds     = nb;
    vp.zoom_level = zoom;
    return ViewError::None;
}

ViewError pan_by_pixels(Viewport& vp, double dx_px, double dy_px)
{
    if (!std::isfinite(dx_px) || !std::isfinite(dy_px))
        return ViewError::InvalidViewport;
    if (vp.pixel_width <= 0 || vp.pixel_height <= 0 || !bounds_valid(vp.bounds))
        return ViewError::InvalidViewport;

    const double sx = vp.bounds.width()  / vp.pixel_width;
    const double sy = vp.bounds.height() / vp.pixel_height;
    const double dre = -dx_px * sx;
    const double dim =  dy_px * sy;   // screen y grows downward

    Bounds nb = vp.bounds;
    nb.xmin += dre;  nb.xmax += dre;
    nb.ymin += dim;  nb.ymax += dim;
    if (!bounds_valid(nb))
        return ViewError::InvalidViewport;

    vp.bounds = nb;
    return ViewError::None;
}
