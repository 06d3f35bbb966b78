#pragma once

struct AppState;

static const float PANEL_WIDTH   = 300.0f;
static const float STATUS_HEIGHT = 24.0f;

void draw_side_panel(AppState& app, float menu_h, float fh);
void draw_status_bar(AppState& app, float fw, float fh);
// Fills the export path with a timestamped name ending in .<ext>.
void suggest_export_path(AppState& app, const char* ext);
void draw_export_dialog(AppState& app);
void draw_about_dialog(AppState& app);
