#pragma once

#include "view_state.hpp"

// Recenter on (target_re, target_im) and scale the half-width by `factor`
// (factor < 1 zooms in). The half-height follows from the pixel aspect and
// zoom_level becomes zoom_level / factor. Callers record history first.
ViewError zoom_at(Viewport& vp, double target_re, double target_im, double factor);

// Translate the bounds by a screen-space delta in pixels. Positive dx moves
// the view content right (the plane moves left under the cursor), positive
// dy moves it down.
ViewError pan_by_pixels(Viewport& vp, double dx_px, double dy_px);
