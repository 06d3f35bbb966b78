#include "cli_render.hpp"
#include "cpu_renderer.hpp"
#include "export.hpp"
#include "render_scheduler.hpp"
#include "viewport_controller.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

void CaptureSurface::show(const RenderResult& result)
{
    last = result;
    last_error.clear();
    ++frames;
}

void CaptureSurface::show_error(uint64_t, const std::string& message)
{
    last_error = message;
    ++errors;
}

int run_cli_render(const ExplorerConfig& cfg)
{
    CpuRenderer    engine(cfg.threads);
    CaptureSurface surface;

    SchedulerConfig scfg;
    scfg.debounce       = std::chrono::milliseconds(cfg.debounce_ms);
    scfg.render_timeout = std::chrono::milliseconds(cfg.render_timeout_ms);
    RenderScheduler scheduler(engine, surface, scfg);

    ControllerConfig ccfg;
    ccfg.base_iterations = cfg.base_iterations;
    ccfg.iteration_cap   = cfg.iteration_cap;
    ccfg.width           = cfg.width;
    ccfg.height          = cfg.height;
    ViewportController controller(ccfg);
    controller.set_listener([&scheduler](const Viewport& vp) {
        scheduler.request_render(vp);
    });

    controller.refresh();
    for (const ZoomStep& z : cfg.zoom_steps) {
        const ViewError err = controller.zoom_at_point(z.re, z.im, z.factor);
        if (err != ViewError::None) {
            spdlog::error("zoom ({}, {}) x{} rejected: {}", z.re, z.im, z.factor,
                          view_error_str(err));
            return 1;
        }
    }

    const Viewport& vp = controller.viewport();
    spdlog::info("rendering {}x{}  zoom {:.6g}  iter {}  [{}, {}] x [{}, {}]",
                 vp.pixel_width, vp.pixel_height, vp.zoom_level, vp.max_iterations,
                 vp.bounds.xmin, vp.bounds.xmax, vp.bounds.ymin, vp.bounds.ymax);

    while (true) {
        const auto now = RenderScheduler::Clock::now();
        scheduler.poll(now);
        if (scheduler.state() == SchedulerState::Idle)
            break;
        const auto wait = scheduler.time_until_deadline(now, std::chrono::milliseconds(50));
        if (scheduler.busy())
            scheduler.wait_for_completion(wait);
        else
            std::this_thread::sleep_for(wait);
    }

    if (surface.frames == 0 || !surface.last_error.empty()) {
        spdlog::error("render failed: {}", surface.last_error.empty()
                                               ? std::string("no frame produced")
                                               : surface.last_error);
        return 1;
    }

    const RenderResult& res = surface.last;
    if (res.precision.warning)
        spdlog::warn("zoom needs {} of {} double digits; expect pixelation",
                     res.precision.decimal_digits_needed, res.precision.max_digits);
    spdlog::info("generation {} rendered in {:.1f} ms", res.generation, res.render_ms);

    const std::string err = export_image(cfg.render_path, res.pixels);
    if (!err.empty()) {
        spdlog::error("export failed: {}", err);
        return 1;
    }
    spdlog::info("saved {}", cfg.render_path);
    return 0;
}
