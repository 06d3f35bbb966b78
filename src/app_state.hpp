#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "config.hpp"
#include "renderer.hpp"
#include "cpu_renderer.hpp"
#include "render_scheduler.hpp"
#include "viewport_controller.hpp"

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB, nw, nh, 0,
                     GL_RGB, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    // Rows are tightly packed RGB, so alignment must be 1.
    void upload(const PixelBuffer& buf) {
        glBindTexture(GL_TEXTURE_2D, id);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGB, GL_UNSIGNED_BYTE, buf.rgb.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

struct AppState;

// Display surface backed by the render texture; runs on the UI thread
// from RenderScheduler::poll().
class GuiSurface : public IDisplaySurface {
public:
    explicit GuiSurface(AppState& app) : app(app) {}
    void show(const RenderResult& result) override;
    void show_error(uint64_t generation, const std::string& message) override;

private:
    AppState& app;
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    explicit AppState(const ExplorerConfig& config)
        : cfg(config)
        , engine(config.threads)
        , surface(*this)
        , scheduler(engine, surface, scheduler_config(config))
        , controller(controller_config(config))
    {
    }

    ExplorerConfig     cfg;
    CpuRenderer        engine;
    GuiSurface         surface;
    RenderScheduler    scheduler;
    ViewportController controller;

    // Last frame on screen
    RenderResult frame;
    bool         has_frame    = false;
    std::string  status       = "Starting...";
    bool         status_error = false;

    // Dialog flags
    bool        show_about  = false;
    bool        show_export = false;

    // Export dialog state. The path is editable; its extension picks the encoder.
    char        exp_path[512] = {};
    bool        exp_done      = false;
    std::string exp_msg;

    // Thread count selector (0 = Auto)
    int thread_sel = 0;

    // Navigation
    bool   left_down     = false;
    bool   panning       = false;
    ImVec2 press_pos     = {};
    ImVec2 pan_last      = {};

    GlTex render_tex;

    static SchedulerConfig scheduler_config(const ExplorerConfig& c)
    {
        SchedulerConfig s;
        s.debounce       = std::chrono::milliseconds(c.debounce_ms);
        s.render_timeout = std::chrono::milliseconds(c.render_timeout_ms);
        return s;
    }

    static ControllerConfig controller_config(const ExplorerConfig& c)
    {
        ControllerConfig cc;
        cc.base_iterations = c.base_iterations;
        cc.iteration_cap   = c.iteration_cap;
        cc.width           = c.width;
        cc.height          = c.height;
        return cc;
    }
};

inline void GuiSurface::show(const RenderResult& result)
{
    app.frame     = result;
    app.has_frame = true;
    app.render_tex.ensure(result.pixels.width, result.pixels.height);
    app.render_tex.upload(result.pixels);
    app.status       = result.precision.warning ? "Ready (precision limit)" : "Ready";
    app.status_error = false;
}

inline void GuiSurface::show_error(uint64_t, const std::string& message)
{
    app.status       = "Error: " + message;
    app.status_error = true;
}
