#pragma once

#include "renderer.hpp"
#include "view_state.hpp"
#include "palette.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <memory>
#include <mutex>

// Largest frame the engine accepts (8K UHD).
constexpr long long MAX_RENDER_PIXELS = 7680LL * 4320LL;

class CpuRenderer : public IRenderEngine {
public:
    // n_threads <= 0 uses hardware_concurrency
    explicit CpuRenderer(int n_threads = 0);

    std::string render(const Viewport& vp, PixelBuffer& buf) override;

    // n=0 restores hw_concurrency. Never blocks: the pool is rebuilt at
    // the start of the next render, and a running render keeps its pool.
    void set_thread_count(int n);
    int  thread_count() const { return requested_threads.load(); }
    int  hw_concurrency() const { return hw_threads; }

private:
    void render_tile(const Viewport& vp, const ColorTable& table,
                     PixelBuffer& buf, int tx, int ty, int tw, int th) const;

    std::mutex                  mtx;   // one render at a time; guards pool
    std::unique_ptr<ThreadPool> pool;
    std::atomic<int>            requested_threads{1};
    int                         hw_threads = 0;
};
