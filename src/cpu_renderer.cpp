#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

// -----------------------------------------------------------------------
// Constructor: build the tile pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer(int n_threads)
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_threads = n;
    requested_threads = n_threads > 0 ? n_threads : n;
    pool = std::make_unique<ThreadPool>(requested_threads.load());
}

void CpuRenderer::set_thread_count(int n)
{
    requested_threads = n < 1 ? hw_threads : n;
}

// -----------------------------------------------------------------------
// Tile renderer, called from thread pool workers
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const Viewport& vp, const ColorTable& table,
                              PixelBuffer& buf, int tx, int ty, int tw, int th) const
{
    const int    W   = buf.width;
    const int    H   = buf.height;
    const int    os  = vp.oversampling;
    const double sx  = vp.bounds.width()  / W;
    const double sy  = vp.bounds.height() / H;
    const double inv = 1.0 / (os * os);

    const ColorParams& col = vp.color;
    const double cycle_norm = 1.0 / std::sqrt(std::max(col.cycle_density, 1.0));

    for (int py = ty; py < ty + th && py < H; ++py) {
        uint8_t*  row = buf.row(py);
        const int end = std::min(tx + tw, W);

        for (int px = tx; px < end; ++px) {
            double acc[3] = {0.0, 0.0, 0.0};

            for (int oy = 0; oy < os; ++oy) {
                // Row 0 is the top edge, i.e. ymax.
                const double im = vp.bounds.ymax - (py + (oy + 0.5) / os) * sy;
                for (int ox = 0; ox < os; ++ox) {
                    const double re = vp.bounds.xmin + (px + (ox + 0.5) / os) * sx;
                    const EscapeSample s = mandelbrot_sample(re, im, vp.max_iterations,
                                                             col.stripe_density);
                    if (!s.escaped)
                        continue;   // interior: black

                    double shade = 1.0;
                    if (col.stripe_density > 0.0)
                        shade -= 0.5 * col.stripe_sigma * (1.0 - s.stripe);
                    if (col.step_density > 0.0) {
                        const double k = s.smooth / col.step_density;
                        shade *= 0.85 + 0.15 * (1.0 - (k - std::floor(k)));
                    }

                    uint8_t rgb[3];
                    palette_color(table, std::sqrt(s.smooth) * cycle_norm, shade, rgb);
                    acc[0] += rgb[0];
                    acc[1] += rgb[1];
                    acc[2] += rgb[2];
                }
            }

            uint8_t* out = row + px * 3;
            out[0] = static_cast<uint8_t>(acc[0] * inv + 0.5);
            out[1] = static_cast<uint8_t>(acc[1] * inv + 0.5);
            out[2] = static_cast<uint8_t>(acc[2] * inv + 0.5);
        }
    }
}

// -----------------------------------------------------------------------
// Top-level render: validate the snapshot, split into tiles
// -----------------------------------------------------------------------
std::string CpuRenderer::render(const Viewport& vp, PixelBuffer& buf)
{
    const int W = vp.pixel_width, H = vp.pixel_height;
    if (W <= 0 || H <= 0)
        return "Invalid pixel dimensions";
    if (static_cast<long long>(W) * H > MAX_RENDER_PIXELS)
        return "Frame too large";
    if (!bounds_valid(vp.bounds))
        return "Degenerate viewport bounds";
    if (vp.max_iterations < 1)
        return "Iteration budget must be positive";
    if (vp.oversampling < 1 || vp.oversampling > MAX_OVERSAMPLING)
        return "Unsupported oversampling factor";

    ColorTable table;
    build_colortable(vp.color.rgb_thetas, table);

    std::lock_guard<std::mutex> lock(mtx);
    const int want = requested_threads.load();
    if (pool->size() != want)
        pool = std::make_unique<ThreadPool>(want);
    buf.resize(W, H);

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;

    for (int ty = 0; ty < H; ty += TILE_H) {
        for (int tx = 0; tx < W; tx += TILE_W) {
            const int tw = std::min(TILE_W, W - tx);
            const int th = std::min(TILE_H, H - ty);
            pool->submit([this, &vp, &table, &buf, tx, ty, tw, th] {
                render_tile(vp, table, buf, tx, ty, tw, th);
            });
        }
    }
    pool->wait();
    return {};
}
