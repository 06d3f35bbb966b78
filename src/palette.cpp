#include "palette.hpp"

#include <cmath>

const ColorTheme g_color_themes[THEME_COUNT] = {
    {"Classic",  {0.0,  0.15, 0.25}},
    {"Fire",     {0.0,  0.05, 0.1 }},
    {"Ocean",    {0.4,  0.6,  0.8 }},
    {"Forest",   {0.2,  0.4,  0.1 }},
    {"Purple",   {0.7,  0.3,  0.9 }},
    {"Sunset",   {0.0,  0.3,  0.6 }},
    {"Electric", {0.2,  0.7,  0.9 }},
    {"Copper",   {0.1,  0.05, 0.0 }},
};

//                    name                thetas              cycle stripe sigma  step
const ColorPreset g_color_presets[PRESET_COUNT] = {
    {"Filigree Detail", {0.0, 0.15, 0.25}, 32.0, 16.0, 0.9,  8.0},
    {"Deep Structure",  {0.7, 0.3,  0.9 }, 64.0, 24.0, 0.85, 12.0},
    {"Fine Detail",     {0.2, 0.7,  0.9 }, 48.0, 12.0, 0.95, 4.0},
    {"Rich Boundaries", {0.0, 0.3,  0.6 }, 56.0, 20.0, 0.88, 10.0},
};

void build_colortable(const double thetas[3], ColorTable& out)
{
    const double two_pi = 2.0 * 3.14159265358979323846;
    for (int i = 0; i < LUT_SIZE; ++i) {
        const double t = static_cast<double>(i) / LUT_SIZE;
        for (int c = 0; c < 3; ++c) {
            const double v = 0.5 + 0.5 * std::sin(two_pi * (t + thetas[c]));
            out.rgb[i][c] = static_cast<uint8_t>(std::lround(v * 255.0));
        }
    }
}

void apply_theme(ColorParams& color, int theme)
{
    if (theme < 0 || theme >= THEME_COUNT) return;
    for (int c = 0; c < 3; ++c)
        color.rgb_thetas[c] = g_color_themes[theme].thetas[c];
}

void apply_preset(ColorParams& color, int preset)
{
    if (preset < 0 || preset >= PRESET_COUNT) return;
    const ColorPreset& p = g_color_presets[preset];
    for (int c = 0; c < 3; ++c)
        color.rgb_thetas[c] = p.thetas[c];
    color.cycle_density  = p.cycle_density;
    color.stripe_density = p.stripe_density;
    color.stripe_sigma   = p.stripe_sigma;
    color.step_density   = p.step_density;
}
