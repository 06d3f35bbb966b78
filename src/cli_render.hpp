#pragma once

#include "config.hpp"
#include "renderer.hpp"

#include <string>

// Keeps the last published frame or error; used without a window.
class CaptureSurface : public IDisplaySurface {
public:
    void show(const RenderResult& result) override;
    void show_error(uint64_t generation, const std::string& message) override;

    RenderResult last;
    std::string  last_error;
    int          frames = 0;
    int          errors = 0;
};

// Headless mode: builds the controller and scheduler, applies cfg.zoom_steps,
// waits for the scheduler to settle and exports the frame to cfg.render_path.
// Returns a process exit code.
int run_cli_render(const ExplorerConfig& cfg);
