#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "cli_render.hpp"
#include "config.hpp"
#include "log.hpp"
#include "ui_panels.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <string>

// Mouse travel below this is a click, above it a drag.
static const float CLICK_SLOP = 5.0f;

static const double CLICK_ZOOM_IN  = 0.25;
static const double CLICK_ZOOM_OUT = 4.0;
static const double WHEEL_ZOOM_IN  = 0.5;
static const double WHEEL_ZOOM_OUT = 2.0;

static void log_rejected(const char* what, ViewError err)
{
    if (err != ViewError::None)
        spdlog::warn("{} rejected: {}", what, view_error_str(err));
}

static void open_export(AppState& app)
{
    app.show_export = true;
    app.exp_done    = false;
    app.exp_msg.clear();
    suggest_export_path(app, "png");
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    ExplorerConfig cfg;
    const std::string arg_err = parse_args(argc, argv, cfg);
    if (!arg_err.empty()) {
        fprintf(stderr, "%s\n\n%s", arg_err.c_str(), usage_text());
        return 2;
    }
    if (cfg.show_help) {
        fputs(usage_text(), stdout);
        return 0;
    }
    init_logging(cfg.log_level);

    if (!cfg.render_path.empty())
        return run_cli_render(cfg);

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        spdlog::critical("SDL_Init error: {}", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);

    SDL_Window* window = SDL_CreateWindow(
        "Zoomscope",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        cfg.width, cfg.height,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        spdlog::critical("SDL_CreateWindow error: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        spdlog::critical("SDL_GL_CreateContext error: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    // -----------------------------------------------------------------------
    // App state. Owned by pointer so it is torn down while GL is still alive.
    // -----------------------------------------------------------------------
    auto app_ptr = std::make_unique<AppState>(cfg);
    AppState& app = *app_ptr;

    // The render worker wakes the event loop with a user event.
    const Uint32 render_done_event = SDL_RegisterEvents(1);
    if (render_done_event != static_cast<Uint32>(-1)) {
        app.scheduler.set_wakeup([render_done_event]() {
            SDL_Event ev;
            SDL_zero(ev);
            ev.type = render_done_event;
            SDL_PushEvent(&ev);
        });
    } else {
        spdlog::warn("SDL_RegisterEvents failed; falling back to polling");
    }

    app.controller.set_listener([&app](const Viewport& vp) {
        app.scheduler.request_render(vp);
    });

    auto update_title = [&]() {
        char tbuf[128];
        std::snprintf(tbuf, sizeof(tbuf), "Zoomscope  [zoom: %.4gx  iter: %d]",
                      app.controller.viewport().zoom_level,
                      app.controller.viewport().max_iterations);
        SDL_SetWindowTitle(window, tbuf);
    };

    spdlog::info("window {}x{}, {} render threads, debounce {} ms",
                 cfg.width, cfg.height, app.engine.thread_count(), cfg.debounce_ms);

    bool running  = true;
    bool first    = true;
    while (running) {
        // Sleep until input, a finished render or the debounce deadline.
        const auto wait = app.scheduler.time_until_deadline(
            RenderScheduler::Clock::now(), std::chrono::milliseconds(50));
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, static_cast<int>(wait.count()))) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }

        if (app.scheduler.poll() > 0)
            update_title();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        const float fw       = static_cast<float>(win_w);
        const float fh       = static_cast<float>(win_h);
        const float menu_h   = ImGui::GetFrameHeight();
        const float render_x = PANEL_WIDTH;
        const float render_y = menu_h;
        const float render_w = fw - PANEL_WIDTH;
        const float render_h = fh - menu_h - STATUS_HEIGHT;
        const int   irw      = static_cast<int>(render_w);
        const int   irh      = static_cast<int>(render_h);

        // Viewport follows the render area; the first frame also kicks off
        // the initial render.
        if (irw > 0 && irh > 0) {
            const ViewError err = app.controller.resize(irw, irh);
            log_rejected("resize", err);
            if (first) {
                app.controller.refresh();
                first = false;
            }
        }

        // -------------------------------------------------------------------
        // Menu bar
        // -------------------------------------------------------------------
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Export Image", "Ctrl+S"))
                    open_export(app);
                ImGui::Separator();
                if (ImGui::MenuItem("Exit")) running = false;
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                if (ImGui::MenuItem("Home", "H"))
                    log_rejected("home", app.controller.reset_home());
                if (ImGui::MenuItem("Back", "Backspace", false,
                                    !app.controller.history().empty()))
                    app.controller.go_back();
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Threads")) {
                const int hw = app.engine.hw_concurrency();
                char buf[32];
                snprintf(buf, sizeof(buf), "Auto (%d)", hw);
                if (ImGui::MenuItem(buf, nullptr, app.thread_sel == 0)) {
                    app.thread_sel = 0;
                    app.engine.set_thread_count(0);
                    app.controller.refresh();
                }
                ImGui::Separator();
                for (int i = 1; i <= hw; ++i) {
                    snprintf(buf, sizeof(buf), "%d", i);
                    if (ImGui::MenuItem(buf, nullptr, app.thread_sel == i)) {
                        app.thread_sel = i;
                        app.engine.set_thread_count(i);
                        app.controller.refresh();
                    }
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Help")) {
                if (ImGui::MenuItem("About", "F1")) app.show_about = true;
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        // -------------------------------------------------------------------
        // Global keyboard shortcuts
        // -------------------------------------------------------------------
        if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl)
            open_export(app);
        if (ImGui::IsKeyPressed(ImGuiKey_F1))
            app.show_about = true;
        if (!io.WantTextInput && !io.KeyCtrl) {
            if (ImGui::IsKeyPressed(ImGuiKey_H))
                log_rejected("home", app.controller.reset_home());
            if (ImGui::IsKeyPressed(ImGuiKey_Backspace))
                app.controller.go_back();
            // Arrow keys: pan by 10% of the render area
            const double step_x = irw * 0.1;
            const double step_y = irh * 0.1;
            if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow,  true))
                log_rejected("pan", app.controller.pan( step_x, 0.0));
            if (ImGui::IsKeyPressed(ImGuiKey_RightArrow, true))
                log_rejected("pan", app.controller.pan(-step_x, 0.0));
            if (ImGui::IsKeyPressed(ImGuiKey_UpArrow,    true))
                log_rejected("pan", app.controller.pan(0.0,  step_y));
            if (ImGui::IsKeyPressed(ImGuiKey_DownArrow,  true))
                log_rejected("pan", app.controller.pan(0.0, -step_y));
        }

        draw_side_panel(app, menu_h, fh);

        // -------------------------------------------------------------------
        // Render area
        // -------------------------------------------------------------------
        ImGui::SetNextWindowPos(ImVec2(render_x, render_y));
        ImGui::SetNextWindowSize(ImVec2(render_w, render_h));
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
        ImGui::Begin("##render", nullptr,
            ImGuiWindowFlags_NoTitleBar            |
            ImGuiWindowFlags_NoResize              |
            ImGuiWindowFlags_NoMove                |
            ImGuiWindowFlags_NoBringToFrontOnFocus |
            ImGuiWindowFlags_NoScrollbar);
        ImGui::PopStyleVar();

        // The previous frame stays on screen until the next one lands.
        if (app.render_tex.id)
            ImGui::Image(app.render_tex.imgui_id(),
                         ImVec2(static_cast<float>(app.render_tex.w),
                                static_cast<float>(app.render_tex.h)));

        const bool render_hovered = ImGui::IsWindowHovered();
        const double mx = io.MousePos.x - render_x;
        const double my = io.MousePos.y - render_y;

        // Mouse wheel: 2x steps centered on the cursor
        if (render_hovered && io.MouseWheel != 0.0f) {
            const double factor = io.MouseWheel > 0.0f ? WHEEL_ZOOM_IN : WHEEL_ZOOM_OUT;
            log_rejected("zoom", app.controller.zoom_at_pixel(mx, my, factor));
        }

        // Left button: click zooms in, drag pans
        if (render_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            app.left_down = true;
            app.panning   = false;
            app.press_pos = io.MousePos;
            app.pan_last  = io.MousePos;
        }
        if (app.left_down) {
            if (ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
                const float tx = io.MousePos.x - app.press_pos.x;
                const float ty = io.MousePos.y - app.press_pos.y;
                if (!app.panning && std::sqrt(tx * tx + ty * ty) >= CLICK_SLOP) {
                    app.panning = true;
                    log_rejected("pan", app.controller.pan(
                        io.MousePos.x - app.pan_last.x,
                        io.MousePos.y - app.pan_last.y, true));
                    app.pan_last = io.MousePos;
                } else if (app.panning &&
                           (io.MousePos.x != app.pan_last.x ||
                            io.MousePos.y != app.pan_last.y)) {
                    log_rejected("pan", app.controller.pan(
                        io.MousePos.x - app.pan_last.x,
                        io.MousePos.y - app.pan_last.y, false));
                    app.pan_last = io.MousePos;
                }
            } else {
                if (!app.panning) {
                    const double px = app.press_pos.x - render_x;
                    const double py = app.press_pos.y - render_y;
                    log_rejected("zoom", app.controller.zoom_at_pixel(px, py, CLICK_ZOOM_IN));
                }
                app.left_down = false;
                app.panning   = false;
            }
        }

        // Right click zooms out
        if (render_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Right) && !app.left_down)
            log_rejected("zoom", app.controller.zoom_at_pixel(mx, my, CLICK_ZOOM_OUT));

        ImGui::End();  // ##render

        draw_status_bar(app, fw, fh);
        draw_export_dialog(app);
        draw_about_dialog(app);

        // -------------------------------------------------------------------
        // Render
        // -------------------------------------------------------------------
        ImGui::Render();
        glViewport(0, 0, win_w, win_h);
        glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    spdlog::info("shutting down after {} renders", app.scheduler.dispatched_count());
    app_ptr.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
