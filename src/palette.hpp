#pragma once

#include "view_state.hpp"

#include <cstdint>

static constexpr int THEME_COUNT  = 8;
static constexpr int PRESET_COUNT = 4;
static constexpr int LUT_SIZE     = 1024;

struct ColorTheme {
    const char* name;
    double      thetas[3];
};

// A preset sets the banding too; see ViewportController for precedence.
struct ColorPreset {
    const char* name;
    double      thetas[3];
    double      cycle_density;
    double      stripe_density;
    double      stripe_sigma;
    double      step_density;
};

extern const ColorTheme  g_color_themes[THEME_COUNT];
extern const ColorPreset g_color_presets[PRESET_COUNT];

// Sine color table: channel c at position t is 0.5 + 0.5*sin(2*pi*(t + theta_c)).
struct ColorTable {
    uint8_t rgb[LUT_SIZE][3];
};

void build_colortable(const double thetas[3], ColorTable& out);

void apply_theme(ColorParams& color, int theme);
void apply_preset(ColorParams& color, int preset);

// Map a normalized palette position (any real, wraps) and a shade factor in
// [0,1] to RGB.
inline void palette_color(const ColorTable& table, double t, double shade, uint8_t* out)
{
    double frac = t - static_cast<double>(static_cast<int64_t>(t));
    if (frac < 0.0) frac += 1.0;
    int idx = static_cast<int>(frac * LUT_SIZE);
    if (idx >= LUT_SIZE) idx = LUT_SIZE - 1;
    if (idx < 0)         idx = 0;
    const uint8_t* c = table.rgb[idx];
    out[0] = static_cast<uint8_t>(c[0] * shade);
    out[1] = static_cast<uint8_t>(c[1] * shade);
    out[2] = static_cast<uint8_t>(c[2] * shade);
}
