#pragma once

#include "view_state.hpp"
#include "history.hpp"

#include <functional>
#include <utility>

enum class ViewParam {
    BaseIterations,
    DynamicIterations,   // 0 = off, anything else = on
    MaxIterations,       // only while dynamic iterations are off
    Oversampling,
    StripeDensity,
    CycleDensity,
    ColorTheme,
    ColorPreset,         // -1 = Custom (clears the preset)
};

struct ControllerConfig {
    int base_iterations = DEFAULT_BASE_ITERATIONS;
    int iteration_cap   = DEFAULT_ITERATION_CAP;
    int width           = 800;
    int height          = 450;
};

// Sole owner of the session's Viewport and HistoryStack. Every mutation is
// computed on a copy and committed only when it succeeds; after a commit the
// listener (normally RenderScheduler::request_render) gets the new viewport.
class ViewportController {
public:
    using Listener = std::function<void(const Viewport&)>;

    explicit ViewportController(const ControllerConfig& cfg = ControllerConfig{});

    void set_listener(Listener fn) { listener = std::move(fn); }

    ViewError resize(int width, int height);
    ViewError zoom_at_pixel(double px, double py, double factor);
    ViewError zoom_at_point(double re, double im, double factor);
    // Screen-space drag. One history entry per gesture: pass new_gesture only
    // for the first delta of a drag.
    ViewError pan(double dx_px, double dy_px, bool new_gesture = true);
    ViewError set_parameter(ViewParam param, double value);
    ViewError reset_home();
    bool      go_back();

    // Re-announce the current viewport (startup, engine settings changed).
    void refresh();

    const Viewport&     viewport() const { return vp; }
    const HistoryStack& history()  const { return hist; }

    int  base_iterations()    const { return base_iter; }
    int  iteration_cap()      const { return cap; }
    bool dynamic_iterations() const { return dynamic; }
    int  active_theme()       const { return theme; }
    int  active_preset()      const { return preset; }

private:
    void adapt_to_zoom(Viewport& next, bool force_iterations) const;
    void commit(const Viewport& next);

    Viewport     vp;
    HistoryStack hist;
    int          base_iter;
    int          cap;
    bool         dynamic = true;
    int          theme   = 0;
    int          preset  = -1;
    Listener     listener;
};
