#include "deep_zoom.hpp"

#include <algorithm>
#include <cmath>

int estimate_iterations(double zoom_level, int base_iterations, int cap)
{
    if (!(zoom_level > 1.0))
        return base_iterations;

    const double b   = static_cast<double>(base_iterations);
    const double est = std::floor(b * std::log10(zoom_level + 1.0) + b);
    if (!std::isfinite(est) || est >= static_cast<double>(cap))
        return cap;
    return static_cast<int>(est);
}

PrecisionInfo precision_info(double zoom_level)
{
    const double safe_zoom = std::isfinite(zoom_level) ? std::max(zoom_level, 1.0) : 1.0;

    PrecisionInfo info;
    info.decimal_digits_needed =
        std::max(1, static_cast<int>(std::floor(std::log10(safe_zoom))) + 2);
    info.warning           = info.decimal_digits_needed > DOUBLE_MAX_DIGITS * 0.8;
    info.percent_of_budget = std::min(100.0,
        static_cast<double>(info.decimal_digits_needed) / DOUBLE_MAX_DIGITS * 100.0);
    return info;
}

ColorBanding color_banding_for_zoom(double zoom_level)
{
    if (zoom_level < 10.0)   return {16.0, 32.0};
    if (zoom_level < 100.0)  return {20.0, 48.0};
    if (zoom_level < 1000.0) return {24.0, 64.0};
    return {32.0, 96.0};
}
