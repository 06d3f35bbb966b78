#pragma once

#include "renderer.hpp"
#include "thread_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

struct SchedulerConfig {
    std::chrono::milliseconds debounce{100};
    std::chrono::milliseconds render_timeout{0};   // 0 disables the watchdog
};

enum class SchedulerState {
    Idle,
    Debouncing,
    Rendering,
    RenderingWithPending,
};

const char* scheduler_state_str(SchedulerState s);

// Turns a stream of viewport snapshots into at most one running render.
//
// All public methods except the wake-up callback belong to the control
// thread. Bursts inside one debounce window collapse to the last snapshot;
// requests arriving while a render is in flight collapse into a single
// pending snapshot that is dispatched as soon as the render completes.
// A render abandoned by the watchdog keeps the worker; the pending snapshot
// is held back until it returns.
// Completions travel back through a locked queue and are only applied by
// poll(), so the display surface is never touched from the worker.
class RenderScheduler {
public:
    using Clock = std::chrono::steady_clock;

    RenderScheduler(IRenderEngine& engine, IDisplaySurface& surface,
                    const SchedulerConfig& cfg = SchedulerConfig{});
    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&)            = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    // Never blocks.
    void request_render(const Viewport& snapshot, Clock::time_point now);
    void request_render(const Viewport& snapshot) { request_render(snapshot, Clock::now()); }

    // Applies finished renders, fires an expired debounce timer and runs the
    // watchdog. Returns the number of results/errors published.
    int poll(Clock::time_point now);
    int poll() { return poll(Clock::now()); }

    // How long the control loop may sleep before the next poll is due.
    // Returns `idle_wait` when no timer is armed.
    std::chrono::milliseconds time_until_deadline(Clock::time_point now,
                                                  std::chrono::milliseconds idle_wait) const;

    // Blocks until the worker has posted a completion or `timeout` elapses.
    bool wait_for_completion(std::chrono::milliseconds timeout);

    // Invoked from the render worker right after a completion is posted.
    // Must be thread-safe and cheap (e.g. push an event to the UI queue).
    void set_wakeup(std::function<void()> fn);

    void set_debounce(std::chrono::milliseconds d) { cfg.debounce = d; }
    void set_render_timeout(std::chrono::milliseconds t) { cfg.render_timeout = t; }
    const SchedulerConfig& config() const { return cfg; }

    SchedulerState state() const;
    bool           busy() const { return in_flight || has_pending; }
    uint64_t       current_generation() const { return in_flight ? in_flight_gen : 0; }
    uint64_t       last_generation() const { return next_gen - 1; }
    uint64_t       dispatched_count() const { return dispatched; }

private:
    void dispatch(const Viewport& snapshot, Clock::time_point now);
    void post_completion(RenderResult&& result);
    bool apply(RenderResult& result, Clock::time_point now);
    void finish_in_flight(Clock::time_point now);
    bool worker_occupied() const { return in_flight || abandoned_gen != 0; }

    IRenderEngine&   engine;
    IDisplaySurface& surface;
    SchedulerConfig  cfg;

    // Control-thread bookkeeping
    bool              timer_armed    = false;
    Clock::time_point deadline;
    Viewport          debounced;
    bool              in_flight      = false;
    uint64_t          in_flight_gen  = 0;
    Clock::time_point in_flight_since;
    uint64_t          abandoned_gen  = 0;   // timed out, still on the worker
    bool              has_pending    = false;
    Viewport          pending;
    uint64_t          next_gen       = 1;
    uint64_t          dispatched     = 0;

    // Worker -> control handoff
    std::mutex               done_mtx;
    std::condition_variable  done_cv;
    std::deque<RenderResult> done;
    std::function<void()>    wakeup;

    // Declared last: joined before the queue above goes away.
    std::unique_ptr<ThreadPool> worker;
};
