#pragma once

#include "view_state.hpp"
#include "deep_zoom.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Pixel buffer: packed 8-bit RGB, 3 bytes per pixel, row 0 at the top.
struct PixelBuffer {
    std::vector<uint8_t> rgb;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        rgb.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 3, 0);
    }

    uint8_t*       row(int y)       { return rgb.data() + static_cast<size_t>(y) * width * 3; }
    const uint8_t* row(int y) const { return rgb.data() + static_cast<size_t>(y) * width * 3; }

    bool empty() const { return width <= 0 || height <= 0; }
};

// Pure, thread-safe function of the viewport. Returns an empty string on
// success or the failure reason. Must not keep a reference to `vp`.
class IRenderEngine {
public:
    virtual ~IRenderEngine() = default;
    virtual std::string render(const Viewport& vp, PixelBuffer& buf) = 0;
};

struct RenderRequest {
    uint64_t generation = 0;
    Viewport viewport;
};

struct RenderResult {
    uint64_t      generation = 0;
    Viewport      viewport;        // what the pixels were computed for
    PixelBuffer   pixels;
    PrecisionInfo precision;
    std::string   error;           // empty on success
    double        render_ms  = 0.0;

    bool ok() const { return error.empty(); }
};

// Receives published frames; called on the control thread only.
class IDisplaySurface {
public:
    virtual ~IDisplaySurface() = default;
    virtual void show(const RenderResult& result) = 0;
    virtual void show_error(uint64_t generation, const std::string& message) = 0;
};
