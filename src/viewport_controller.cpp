#include "viewport_controller.hpp"
#include "coord_mapper.hpp"
#include "zoom_transform.hpp"
#include "deep_zoom.hpp"
#include "palette.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

static bool is_integral(double v)
{
    return std::isfinite(v) && std::floor(v) == v;
}

ViewportController::ViewportController(const ControllerConfig& cfg)
    : base_iter(cfg.base_iterations)
    , cap(cfg.iteration_cap)
{
    if (cap < 1) cap = DEFAULT_ITERATION_CAP;
    if (base_iter < 1 || base_iter > cap) base_iter = std::min(DEFAULT_BASE_ITERATIONS, cap);

    vp.bounds         = home_bounds();
    vp.max_iterations = base_iter;
    apply_theme(vp.color, theme);
    if (fit_aspect_ratio(vp, cfg.width, cfg.height) != ViewError::None)
        spdlog::warn("controller: invalid initial size {}x{}, keeping {}x{}",
                     cfg.width, cfg.height, vp.pixel_width, vp.pixel_height);
    adapt_to_zoom(vp, true);
}

// ---------------------------------------------------------------------------
// Derived parameters: iteration budget and color banding follow the zoom
// ---------------------------------------------------------------------------
void ViewportController::adapt_to_zoom(Viewport& next, bool force_iterations) const
{
    if (dynamic) {
        const int est = estimate_iterations(next.zoom_level, base_iter, cap);
        const int cur = next.max_iterations;
        // 10% hysteresis so small zoom steps do not keep changing the budget
        if (force_iterations || std::abs(est - cur) > 0.1 * cur)
            next.max_iterations = est;
    } else {
        next.max_iterations = base_iter;
    }

    if (preset < 0) {
        const ColorBanding cb = color_banding_for_zoom(next.zoom_level);
        next.color.stripe_density = cb.stripe_density;
        next.color.cycle_density  = cb.cycle_density;
    }
}

void ViewportController::commit(const Viewport& next)
{
    vp = next;
    if (listener) listener(vp);
}

void ViewportController::refresh()
{
    if (listener) listener(vp);
}

// ---------------------------------------------------------------------------
// Input events
// ---------------------------------------------------------------------------
ViewError ViewportController::resize(int width, int height)
{
    if (width == vp.pixel_width && height == vp.pixel_height)
        return ViewError::None;

    Viewport next = vp;
    const ViewError err = fit_aspect_ratio(next, width, height);
    if (err != ViewError::None) {
        spdlog::debug("controller: resize {}x{} rejected ({})", width, height, view_error_str(err));
        return err;
    }
    commit(next);
    return ViewError::None;
}

ViewError ViewportController::zoom_at_pixel(double px, double py, double factor)
{
    PlanePoint p;
    const ViewError err = pixel_to_complex(px, py, vp, p);
    if (err != ViewError::None) {
        spdlog::debug("controller: zoom at ({}, {}) rejected ({})", px, py, view_error_str(err));
        return err;
    }
    return zoom_at_point(p.re, p.im, factor);
}

ViewError ViewportController::zoom_at_point(double re, double im, double factor)
{
    Viewport next = vp;
    const ViewError err = zoom_at(next, re, im, factor);
    if (err != ViewError::None) {
        spdlog::debug("controller: zoom x{} rejected ({})", factor, view_error_str(err));
        return err;
    }
    adapt_to_zoom(next, false);

    hist.push(vp.bounds);
    commit(next);
    return ViewError::None;
}

ViewError ViewportController::pan(double dx_px, double dy_px, bool new_gesture)
{
    if (dx_px == 0.0 && dy_px == 0.0)
        return ViewError::None;

    Viewport next = vp;
    const ViewError err = pan_by_pixels(next, dx_px, dy_px);
    if (err != ViewError::None)
        return err;

    if (new_gesture) hist.push(vp.bounds);
    commit(next);
    return ViewError::None;
}

ViewError ViewportController::reset_home()
{
    Viewport next = vp;
    next.bounds     = home_bounds();
    next.zoom_level = 1.0;
    const ViewError err = fit_aspect_ratio(next, vp.pixel_width, vp.pixel_height);
    if (err != ViewError::None)
        return err;
    next.max_iterations = base_iter;
    adapt_to_zoom(next, true);

    hist.push(vp.bounds);
    commit(next);
    return ViewError::None;
}

bool ViewportController::go_back()
{
    Bounds prev;
    if (!hist.pop(prev))
        return false;

    Viewport next = vp;
    next.bounds = prev;
    if (fit_aspect_ratio(next, vp.pixel_width, vp.pixel_height) != ViewError::None) {
        spdlog::warn("controller: discarding unusable history entry");
        return false;
    }
    // History stores bounds only; zoom is relative to the home width.
    next.zoom_level = home_bounds().width() / next.bounds.width();
    adapt_to_zoom(next, false);
    commit(next);
    return true;
}

// ---------------------------------------------------------------------------
// Parameter changes
// ---------------------------------------------------------------------------
ViewError ViewportController::set_parameter(ViewParam param, double value)
{
    Viewport next = vp;

    switch (param) {
        case ViewParam::BaseIterations:
            if (!is_integral(value) || value < 1.0 || value > cap)
                return ViewError::InvalidParameter;
            base_iter = static_cast<int>(value);
            adapt_to_zoom(next, true);
            break;

        case ViewParam::DynamicIterations:
            if (!std::isfinite(value))
                return ViewError::InvalidParameter;
            dynamic = value != 0.0;
            adapt_to_zoom(next, true);
            break;

        case ViewParam::MaxIterations:
            if (dynamic || !is_integral(value) || value < 1.0 || value > cap)
                return ViewError::InvalidParameter;
            // Fixed budget: the base follows so later zooms keep it.
            base_iter           = static_cast<int>(value);
            next.max_iterations = base_iter;
            break;

        case ViewParam::Oversampling:
            if (!is_integral(value) || value < 1.0 || value > MAX_OVERSAMPLING)
                return ViewError::InvalidParameter;
            next.oversampling = static_cast<int>(value);
            break;

        case ViewParam::StripeDensity:
            if (!std::isfinite(value) || value < 0.0 || value > 64.0)
                return ViewError::InvalidParameter;
            preset = -1;
            next.color.stripe_density = value;
            break;

        case ViewParam::CycleDensity:
            if (!std::isfinite(value) || value < 1.0 || value > 256.0)
                return ViewError::InvalidParameter;
            preset = -1;
            next.color.cycle_density = value;
            break;

        case ViewParam::ColorTheme:
            if (!is_integral(value) || value < 0.0 || value >= THEME_COUNT)
                return ViewError::InvalidParameter;
            theme = static_cast<int>(value);
            apply_theme(next.color, theme);
            break;

        case ViewParam::ColorPreset:
            if (!is_integral(value) || value < -1.0 || value >= PRESET_COUNT)
                return ViewError::InvalidParameter;
            preset = static_cast<int>(value);
            if (preset >= 0) {
                apply_preset(next.color, preset);
            } else {
                apply_theme(next.color, theme);
                adapt_to_zoom(next, false);
            }
            break;
    }

    commit(next);
    return ViewError::None;
}
