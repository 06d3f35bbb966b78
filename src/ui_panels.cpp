#include "ui_panels.hpp"
#include "app_state.hpp"
#include "deep_zoom.hpp"
#include "palette.hpp"
#include "export.hpp"
#include "imgui.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>
#include <string>

static void set_param(AppState& app, ViewParam p, double v)
{
    const ViewError err = app.controller.set_parameter(p, v);
    if (err != ViewError::None)
        spdlog::warn("parameter change rejected: {}", view_error_str(err));
}

// ---------------------------------------------------------------------------
// Side panel: view info, iterations, color, quality, navigation
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, float menu_h, float fh)
{
    const Viewport& vp = app.controller.viewport();

    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    // --- Current view ---
    ImGui::TextDisabled("CURRENT VIEW");
    ImGui::Separator();
    ImGui::Text("Real: [%.10f, %.10f]", vp.bounds.xmin, vp.bounds.xmax);
    ImGui::Text("Imag: [%.10f, %.10f]", vp.bounds.ymin, vp.bounds.ymax);
    ImGui::Text("Zoom: %.4gx", vp.zoom_level);
    {
        const PrecisionInfo pi = precision_info(vp.zoom_level);
        char label[64];
        std::snprintf(label, sizeof(label), "%d / %d digits",
                      pi.decimal_digits_needed, pi.max_digits);
        if (pi.warning)
            ImGui::PushStyleColor(ImGuiCol_PlotHistogram, ImVec4(1.0f, 0.45f, 0.2f, 1.0f));
        ImGui::ProgressBar(static_cast<float>(pi.percent_of_budget / 100.0),
                           ImVec2(-1.0f, 0.0f), label);
        if (pi.warning) {
            ImGui::PopStyleColor();
            ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f),
                               "Approaching double precision limit");
        }
    }

    // --- Iteration count ---
    ImGui::Spacing();
    ImGui::TextDisabled("ITERATIONS");
    ImGui::Separator();
    {
        bool dyn = app.controller.dynamic_iterations();
        if (ImGui::Checkbox("Scale with zoom", &dyn))
            set_param(app, ViewParam::DynamicIterations, dyn ? 1.0 : 0.0);

        int base = app.controller.base_iterations();
        ImGui::Text("Base");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##base", &base, 50, 5000, "%d", ImGuiSliderFlags_Logarithmic))
            set_param(app, ViewParam::BaseIterations, base);
        ImGui::Text("Current: %d  (cap %d)", vp.max_iterations, app.controller.iteration_cap());
    }

    // --- Color ---
    ImGui::Spacing();
    ImGui::TextDisabled("COLOR");
    ImGui::Separator();
    {
        static const char* theme_names[THEME_COUNT];
        static const char* preset_names[PRESET_COUNT + 1];
        for (int i = 0; i < THEME_COUNT; ++i)  theme_names[i] = g_color_themes[i].name;
        preset_names[0] = "Custom";
        for (int i = 0; i < PRESET_COUNT; ++i) preset_names[i + 1] = g_color_presets[i].name;

        int theme = app.controller.active_theme();
        ImGui::Text("Theme");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##theme", &theme, theme_names, THEME_COUNT))
            set_param(app, ViewParam::ColorTheme, theme);

        int preset = app.controller.active_preset() + 1;
        ImGui::Text("Preset");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##preset", &preset, preset_names, PRESET_COUNT + 1))
            set_param(app, ViewParam::ColorPreset, preset - 1);

        float stripe = static_cast<float>(vp.color.stripe_density);
        ImGui::Text("Stripe density");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderFloat("##stripe", &stripe, 0.0f, 64.0f, "%.0f"))
            set_param(app, ViewParam::StripeDensity, static_cast<double>(stripe));

        float cycle = static_cast<float>(vp.color.cycle_density);
        ImGui::Text("Cycle density");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderFloat("##cycle", &cycle, 1.0f, 256.0f, "%.0f"))
            set_param(app, ViewParam::CycleDensity, static_cast<double>(cycle));
        if (app.controller.active_preset() < 0)
            ImGui::TextDisabled("Banding follows zoom depth");
    }

    // --- Quality ---
    ImGui::Spacing();
    ImGui::TextDisabled("QUALITY");
    ImGui::Separator();
    {
        static const char* os_names[] = {"1x (off)", "2x2", "3x3"};
        int os = vp.oversampling - 1;
        ImGui::Text("Oversampling");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##os", &os, os_names, MAX_OVERSAMPLING))
            set_param(app, ViewParam::Oversampling, os + 1);
    }

    // --- Navigation ---
    ImGui::Spacing();
    ImGui::TextDisabled("NAVIGATION");
    ImGui::Separator();
    {
        const HistoryStack& hist = app.controller.history();
        if (ImGui::Button("Home", ImVec2(ImGui::GetContentRegionAvail().x * 0.5f, 0.0f)))
            app.controller.reset_home();
        ImGui::SameLine();
        ImGui::BeginDisabled(hist.empty());
        if (ImGui::Button("Back", ImVec2(-1.0f, 0.0f)))
            app.controller.go_back();
        ImGui::EndDisabled();
        ImGui::TextDisabled("History: %d / %d", static_cast<int>(hist.size()),
                            static_cast<int>(hist.capacity()));
        ImGui::Spacing();
        ImGui::TextWrapped("Click to zoom in, right-click to zoom out, "
                           "wheel for 2x steps, drag to pan.");
    }

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();

    const Viewport& vp = app.controller.viewport();
    const char* status = app.status.c_str();
    if (app.scheduler.busy())
        status = "Computing...";

    if (app.status_error && !app.scheduler.busy())
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", status);
    else
        ImGui::Text("%s", status);
    ImGui::SameLine(220.0f);
    ImGui::Text("x: %.10f   y: %.10f   zoom: %.4gx   iter: %d   gen %llu  %.0f ms  [%dt]",
                vp.bounds.center_x(), vp.bounds.center_y(), vp.zoom_level,
                vp.max_iterations,
                static_cast<unsigned long long>(app.frame.generation),
                app.frame.render_ms,
                app.engine.thread_count());
    ImGui::End();
}

// ---------------------------------------------------------------------------
// Export dialog: writes the frame currently on screen
// ---------------------------------------------------------------------------
void suggest_export_path(AppState& app, const char* ext)
{
    const std::string name = export_file_name(app.frame.viewport, std::time(nullptr), ext);
    std::snprintf(app.exp_path, sizeof(app.exp_path), "%s", name.c_str());
}

void draw_export_dialog(AppState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Export Image##dlg");
        app.show_export = false;
    }
    if (!ImGui::BeginPopupModal("Export Image##dlg", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize))
        return;

    if (!app.has_frame) {
        ImGui::TextDisabled("No frame rendered yet");
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
        return;
    }

    const Viewport& shown = app.frame.viewport;
    ImGui::Text("Frame %d x %d, zoom %.3gx, %d iterations",
                app.frame.pixels.width, app.frame.pixels.height,
                shown.zoom_level, shown.max_iterations);
    ImGui::Spacing();

    if (app.exp_done) {
        if (app.exp_msg.empty())
            ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f), "Saved: %s", app.exp_path);
        else
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Error: %s", app.exp_msg.c_str());
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
        return;
    }

    ImGui::SetNextItemWidth(420.0f);
    ImGui::InputText("##path", app.exp_path, sizeof(app.exp_path));
    if (ImGui::Button(".png"))
        suggest_export_path(app, "png");
    if (jxl_available()) {
        ImGui::SameLine();
        if (ImGui::Button(".jxl"))
            suggest_export_path(app, "jxl");
    }
    ImGui::SameLine();
    ImGui::TextDisabled(jxl_available() ? "lossless PNG or JPEG XL"
                                        : "PNG only (no JPEG XL support)");

    ImGui::Spacing();
    ImGui::BeginDisabled(app.exp_path[0] == '\0');
    if (ImGui::Button("Save", ImVec2(120.0f, 0.0f))) {
        app.exp_msg  = export_image(app.exp_path, app.frame.pixels);
        app.exp_done = true;
        if (app.exp_msg.empty())
            spdlog::info("exported {}", app.exp_path);
        else
            spdlog::error("export of {} failed: {}", app.exp_path, app.exp_msg);
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
        ImGui::CloseCurrentPopup();
    ImGui::EndPopup();
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (!ImGui::BeginPopupModal("About##dlg", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize))
        return;

    ImGui::Text("Zoomscope");
    ImGui::Separator();
    ImGui::Spacing();
    ImGui::Text("Deep-zoom Mandelbrot viewer with a non-blocking render queue.");
    ImGui::Spacing();
    ImGui::TextDisabled("Debounce %d ms, one render in flight at a time",
                        app.cfg.debounce_ms);
    ImGui::TextDisabled("Iterations and color banding adapt to zoom depth");
    ImGui::TextDisabled("PNG%s export", jxl_available() ? " and JPEG XL" : "");
    ImGui::Spacing();
    ImGui::TextDisabled("Built with Dear ImGui, SDL2, libpng, spdlog");
    ImGui::Spacing();
    ImGui::SetCursorPosX(
        (ImGui::GetContentRegionAvail().x - 120.0f) * 0.5f
        + ImGui::GetCursorPosX());
    if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
        ImGui::CloseCurrentPopup();
    ImGui::EndPopup();
}
