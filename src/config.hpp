#pragma once

#include <string>
#include <vector>

struct ZoomStep {
    double re     = 0.0;
    double im     = 0.0;
    double factor = 1.0;
};

struct ExplorerConfig {
    int         width             = 1400;
    int         height            = 900;
    int         debounce_ms       = 100;
    int         render_timeout_ms = 0;      // 0 = watchdog off
    int         base_iterations   = 500;
    int         iteration_cap     = 50000;
    int         threads           = 0;      // 0 = hardware concurrency
    std::string log_level         = "info";

    // Headless mode: render once and export instead of opening a window.
    std::string           render_path;
    std::vector<ZoomStep> zoom_steps;

    bool show_help = false;
};

// Returns empty string on success, or an error message on failure.
std::string parse_args(int argc, const char* const* argv, ExplorerConfig& cfg);

const char* usage_text();
