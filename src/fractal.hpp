#pragma once

#include <algorithm>
#include <cmath>

struct EscapeSample {
    double smooth  = 0.0;   // normalized iteration count, == max_iter for interior
    double stripe  = 0.0;   // stripe average in [0,1]
    bool   escaped = false;
};

// Escape radius is large so the stripe average and the smooth count settle.
constexpr double ESCAPE_RADIUS2 = 1.0e6;

// Mandelbrot escape-time with stripe-average accumulation. The stripe term
// is 0.5 + 0.5*sin(stripe_density * arg z) averaged along the orbit, with
// the last sample blended by the fractional part of the smooth count.
inline EscapeSample mandelbrot_sample(double cr, double ci, int max_iter,
                                      double stripe_density)
{
    EscapeSample s;

    // Main cardioid and period-2 bulb never escape.
    const double q = (cr - 0.25) * (cr - 0.25) + ci * ci;
    if (q * (q + (cr - 0.25)) <= 0.25 * ci * ci ||
        (cr + 1.0) * (cr + 1.0) + ci * ci <= 0.0625) {
        s.smooth = static_cast<double>(max_iter);
        return s;
    }

    const bool   stripes = stripe_density > 0.0;
    double zr = 0.0, zi = 0.0;
    double sum = 0.0, last = 0.0;
    int    i   = 0;
    while (i < max_iter) {
        const double zr2 = zr * zr, zi2 = zi * zi;
        if (zr2 + zi2 > ESCAPE_RADIUS2) {
            const double log_zn = std::log(zr2 + zi2) * 0.5;
            const double nu     = std::log(log_zn / std::log(2.0)) / std::log(2.0);
            s.smooth  = std::max(0.0, static_cast<double>(i) + 1.0 - nu);
            s.escaped = true;
            if (stripes && i > 1) {
                const double frac = s.smooth - std::floor(s.smooth);
                const double avg  = sum / i;
                const double prev = (sum - last) / (i - 1);
                s.stripe = frac * avg + (1.0 - frac) * prev;
            }
            return s;
        }
        const double nzi = 2.0 * zr * zi + ci;
        zr = zr2 - zi2 + cr;
        zi = nzi;
        if (stripes) {
            last = 0.5 + 0.5 * std::sin(stripe_density * std::atan2(zi, zr));
            sum += last;
        }
        ++i;
    }
    s.smooth = static_cast<double>(max_iter);
    return s;
}
