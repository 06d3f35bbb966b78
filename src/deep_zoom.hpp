#pragma once

#include "view_state.hpp"

// Decimal digits a 64-bit double resolves reliably.
constexpr int DOUBLE_MAX_DIGITS = 15;

struct PrecisionInfo {
    int    decimal_digits_needed = 1;
    bool   warning               = false;  // approaching the double resolution limit
    double percent_of_budget     = 0.0;    // 0..100
    int    max_digits            = DOUBLE_MAX_DIGITS;
};

struct ColorBanding {
    double stripe_density = 16.0;
    double cycle_density  = 32.0;
};

// Iteration budget for a zoom depth. Returns base_iterations unchanged up to
// zoom 1.0, then grows with log10(zoom + 1) and saturates at `cap`.
int estimate_iterations(double zoom_level, int base_iterations,
                        int cap = DEFAULT_ITERATION_CAP);

// Advisory only: how many decimal digits the current zoom needs and whether
// that approaches what a double can resolve.
PrecisionInfo precision_info(double zoom_level);

// Step function of zoom depth; deeper views get denser stripes and cycles.
ColorBanding color_banding_for_zoom(double zoom_level);
