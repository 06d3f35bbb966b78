#include "render_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

const char* scheduler_state_str(SchedulerState s)
{
    switch (s) {
        case SchedulerState::Idle:                 return "idle";
        case SchedulerState::Debouncing:           return "debouncing";
        case SchedulerState::Rendering:            return "rendering";
        case SchedulerState::RenderingWithPending: return "rendering+pending";
    }
    return "unknown";
}

RenderScheduler::RenderScheduler(IRenderEngine& engine, IDisplaySurface& surface,
                                 const SchedulerConfig& cfg)
    : engine(engine)
    , surface(surface)
    , cfg(cfg)
    , worker(std::make_unique<ThreadPool>(1))
{
}

RenderScheduler::~RenderScheduler()
{
    // A render that has already started is waited for; anything queued
    // behind it is discarded. Undelivered completions go with the queue.
    const int dropped = worker->discard_queued();
    if (dropped > 0)
        spdlog::debug("scheduler: discarded {} queued render(s) on shutdown", dropped);
    worker.reset();
}

SchedulerState RenderScheduler::state() const
{
    if (in_flight)
        return has_pending ? SchedulerState::RenderingWithPending
                           : SchedulerState::Rendering;
    if (has_pending)
        return SchedulerState::RenderingWithPending;   // behind an abandoned render
    return timer_armed ? SchedulerState::Debouncing : SchedulerState::Idle;
}

void RenderScheduler::request_render(const Viewport& snapshot, Clock::time_point now)
{
    if (worker_occupied()) {
        if (has_pending)
            spdlog::trace("scheduler: replacing pending snapshot");
        pending     = snapshot;
        has_pending = true;
        return;
    }
    debounced   = snapshot;
    timer_armed = true;
    deadline    = now + cfg.debounce;
}

int RenderScheduler::poll(Clock::time_point now)
{
    int published = 0;

    std::deque<RenderResult> ready;
    {
        std::lock_guard<std::mutex> lock(done_mtx);
        ready.swap(done);
    }
    for (auto& r : ready)
        if (apply(r, now)) ++published;

    if (timer_armed && now >= deadline) {
        timer_armed = false;
        if (worker_occupied()) {
            pending     = debounced;
            has_pending = true;
        } else {
            dispatch(debounced, now);
        }
    }

    if (in_flight && cfg.render_timeout.count() > 0 &&
        now - in_flight_since >= cfg.render_timeout) {
        const uint64_t gen = in_flight_gen;
        spdlog::warn("scheduler: generation {} exceeded {} ms, abandoning it",
                     gen, cfg.render_timeout.count());
        surface.show_error(gen, "Render timed out after " +
                                std::to_string(cfg.render_timeout.count()) + " ms");
        ++published;
        // The render keeps the worker until it returns. Anything pending
        // waits for it, so its own timeout starts from a free worker.
        abandoned_gen = gen;
        finish_in_flight(now);
    }

    return published;
}

std::chrono::milliseconds RenderScheduler::time_until_deadline(
    Clock::time_point now, std::chrono::milliseconds idle_wait) const
{
    using std::chrono::milliseconds;
    milliseconds wait = idle_wait;

    auto until = [&](Clock::time_point t) {
        if (t <= now) return milliseconds(0);
        // Round up so the loop never wakes just before the deadline.
        return std::chrono::duration_cast<milliseconds>(t - now) + milliseconds(1);
    };

    if (timer_armed)
        wait = std::min(wait, until(deadline));
    if (in_flight && cfg.render_timeout.count() > 0)
        wait = std::min(wait, until(in_flight_since + cfg.render_timeout));
    return wait;
}

bool RenderScheduler::wait_for_completion(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(done_mtx);
    return done_cv.wait_for(lock, timeout, [this] { return !done.empty(); });
}

void RenderScheduler::set_wakeup(std::function<void()> fn)
{
    std::lock_guard<std::mutex> lock(done_mtx);
    wakeup = std::move(fn);
}

// ---------------------------------------------------------------------------
// Dispatch: hand an owned copy of the snapshot to the render worker
// ---------------------------------------------------------------------------
void RenderScheduler::dispatch(const Viewport& snapshot, Clock::time_point now)
{
    RenderRequest req;
    req.generation = next_gen++;
    req.viewport   = snapshot;

    in_flight       = true;
    in_flight_gen   = req.generation;
    in_flight_since = now;
    ++dispatched;

    const PrecisionInfo precision = precision_info(snapshot.zoom_level);
    if (precision.warning)
        spdlog::info("generation {}: zoom {:.3g} needs {} digits ({:.0f}% of double)",
                     req.generation, snapshot.zoom_level,
                     precision.decimal_digits_needed, precision.percent_of_budget);
    spdlog::debug("scheduler: dispatch generation {} ({}x{}, {} iter)",
                  req.generation, snapshot.pixel_width, snapshot.pixel_height,
                  snapshot.max_iterations);

    worker->submit([this, req, precision] {
        RenderResult res;
        res.generation = req.generation;
        res.viewport   = req.viewport;
        res.precision  = precision;

        const auto t0 = Clock::now();
        try {
            res.error = engine.render(req.viewport, res.pixels);
        } catch (const std::exception& e) {
            res.error = e.what();
        } catch (...) {
            res.error = "render engine threw a non-standard exception";
        }
        res.render_ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
        if (!res.ok())
            res.pixels = PixelBuffer{};

        post_completion(std::move(res));
    });
}

void RenderScheduler::post_completion(RenderResult&& result)
{
    std::function<void()> wake;
    {
        std::lock_guard<std::mutex> lock(done_mtx);
        done.push_back(std::move(result));
        wake = wakeup;
    }
    done_cv.notify_all();
    if (wake) wake();
}

// ---------------------------------------------------------------------------
// Completion: publish, then move straight on to the pending snapshot
// ---------------------------------------------------------------------------
bool RenderScheduler::apply(RenderResult& result, Clock::time_point now)
{
    if (abandoned_gen != 0 && result.generation == abandoned_gen) {
        spdlog::debug("scheduler: dropping abandoned generation {}", result.generation);
        abandoned_gen = 0;
        if (!in_flight && has_pending) {
            has_pending = false;
            dispatch(pending, now);
        }
        return false;
    }
    if (!in_flight || result.generation != in_flight_gen) {
        spdlog::debug("scheduler: dropping stale generation {}", result.generation);
        return false;
    }

    if (result.ok()) {
        spdlog::debug("scheduler: generation {} done in {:.1f} ms",
                      result.generation, result.render_ms);
        surface.show(result);
    } else {
        spdlog::error("scheduler: generation {} failed: {}", result.generation, result.error);
        surface.show_error(result.generation, result.error);
    }
    finish_in_flight(now);
    return true;
}

void RenderScheduler::finish_in_flight(Clock::time_point now)
{
    in_flight = false;
    if (has_pending && abandoned_gen == 0) {
        has_pending = false;
        dispatch(pending, now);
    }
}
