#include "render_scheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Clock = RenderScheduler::Clock;

// Viewports are told apart by their iteration budget.
static Viewport tagged(int tag)
{
    Viewport vp;
    vp.pixel_width    = 4;
    vp.pixel_height   = 3;
    vp.max_iterations = tag;
    return vp;
}

// Engine whose renders can be held at a gate until the test releases them.
class GatedEngine : public IRenderEngine {
public:
    explicit GatedEngine(bool gated = false) : gated(gated) {}

    std::string render(const Viewport& vp, PixelBuffer& buf) override
    {
        std::unique_lock<std::mutex> lock(mtx);
        tags.push_back(vp.max_iterations);
        ++started;
        ++running;
        if (running > max_running) max_running = running;
        cv.notify_all();

        if (gated) {
            cv.wait(lock, [this] { return permits > 0; });
            --permits;
        }
        if (delay.count() > 0) {
            lock.unlock();
            std::this_thread::sleep_for(delay);
            lock.lock();
        }
        --running;

        if (vp.max_iterations == throw_tag)
            throw std::runtime_error("engine exploded");
        if (vp.max_iterations == fail_tag)
            return "synthetic failure";
        buf.resize(vp.pixel_width, vp.pixel_height);
        return {};
    }

    void release(int n = 1)
    {
        std::lock_guard<std::mutex> lock(mtx);
        permits += n;
        cv.notify_all();
    }

    bool wait_started(int n)
    {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, 5s, [&] { return started >= n; });
    }

    std::vector<int> seen()
    {
        std::lock_guard<std::mutex> lock(mtx);
        return tags;
    }

    int peak()
    {
        std::lock_guard<std::mutex> lock(mtx);
        return max_running;
    }

    int                       fail_tag  = -1;
    int                       throw_tag = -1;
    std::chrono::milliseconds delay{0};

private:
    std::mutex              mtx;
    std::condition_variable cv;
    bool                    gated;
    int                     permits     = 0;
    int                     started     = 0;
    int                     running     = 0;
    int                     max_running = 0;
    std::vector<int>        tags;
};

class RecordingSurface : public IDisplaySurface {
public:
    void show(const RenderResult& result) override
    {
        shown.push_back(result);
    }

    void show_error(uint64_t generation, const std::string& message) override
    {
        errors.push_back({generation, message});
    }

    struct Error {
        uint64_t    generation;
        std::string message;
    };

    std::vector<RenderResult> shown;
    std::vector<Error>        errors;
};

// Waits for the worker, then polls once at `now`.
static int settle(RenderScheduler& s, Clock::time_point now)
{
    EXPECT_TRUE(s.wait_for_completion(5000ms));
    return s.poll(now);
}

TEST(RenderScheduler, StartsIdle)
{
    GatedEngine      engine;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    EXPECT_EQ(s.state(), SchedulerState::Idle);
    EXPECT_FALSE(s.busy());
    EXPECT_EQ(s.poll(Clock::now()), 0);
    EXPECT_EQ(s.dispatched_count(), 0u);
}

TEST(RenderScheduler, BurstCollapsesToLastSnapshot)
{
    GatedEngine      engine;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    const auto t0 = Clock::now();

    s.request_render(tagged(1), t0);
    s.request_render(tagged(2), t0 + 10ms);
    s.request_render(tagged(3), t0 + 20ms);
    EXPECT_EQ(s.state(), SchedulerState::Debouncing);

    // The last request restarted the 100 ms window.
    s.poll(t0 + 110ms);
    EXPECT_EQ(s.dispatched_count(), 0u);
    EXPECT_EQ(s.state(), SchedulerState::Debouncing);

    s.poll(t0 + 120ms);
    EXPECT_EQ(s.dispatched_count(), 1u);
    EXPECT_TRUE(s.busy());

    EXPECT_EQ(settle(s, t0 + 130ms), 1);
    EXPECT_EQ(s.state(), SchedulerState::Idle);
    ASSERT_EQ(surface.shown.size(), 1u);
    EXPECT_EQ(surface.shown[0].viewport.max_iterations, 3);
    EXPECT_EQ(surface.shown[0].generation, 1u);
    EXPECT_EQ(surface.shown[0].pixels.width, 4);
    EXPECT_EQ(engine.seen(), std::vector<int>({3}));
}

TEST(RenderScheduler, RequestsWhileRenderingCollapseIntoOneFollowUp)
{
    GatedEngine      engine(true);
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    const auto t0 = Clock::now();

    s.request_render(tagged(1), t0);
    s.poll(t0 + 100ms);
    ASSERT_TRUE(engine.wait_started(1));
    EXPECT_EQ(s.state(), SchedulerState::Rendering);
    EXPECT_EQ(s.current_generation(), 1u);

    s.request_render(tagged(2), t0 + 110ms);
    s.request_render(tagged(3), t0 + 120ms);
    s.request_render(tagged(4), t0 + 130ms);
    EXPECT_EQ(s.state(), SchedulerState::RenderingWithPending);
    EXPECT_EQ(s.dispatched_count(), 1u);

    engine.release();
    EXPECT_EQ(settle(s, t0 + 200ms), 1);
    // Pending snapshot goes out immediately, without a debounce.
    EXPECT_EQ(s.state(), SchedulerState::Rendering);
    EXPECT_EQ(s.current_generation(), 2u);

    engine.release();
    EXPECT_EQ(settle(s, t0 + 300ms), 1);
    EXPECT_EQ(s.state(), SchedulerState::Idle);

    ASSERT_EQ(surface.shown.size(), 2u);
    EXPECT_EQ(surface.shown[0].viewport.max_iterations, 1);
    EXPECT_EQ(surface.shown[1].viewport.max_iterations, 4);
    EXPECT_EQ(engine.seen(), std::vector<int>({1, 4}));
    EXPECT_EQ(s.dispatched_count(), 2u);
}

TEST(RenderScheduler, FailurePublishesErrorAndDispatchesPending)
{
    GatedEngine      engine(true);
    engine.fail_tag = 1;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    const auto t0 = Clock::now();

    s.request_render(tagged(1), t0);
    s.poll(t0 + 100ms);
    ASSERT_TRUE(engine.wait_started(1));
    s.request_render(tagged(2), t0 + 110ms);

    engine.release();
    EXPECT_EQ(settle(s, t0 + 200ms), 1);
    ASSERT_EQ(surface.errors.size(), 1u);
    EXPECT_EQ(surface.errors[0].generation, 1u);
    EXPECT_EQ(surface.errors[0].message, "synthetic failure");
    EXPECT_TRUE(surface.shown.empty());
    EXPECT_EQ(s.state(), SchedulerState::Rendering);

    engine.release();
    EXPECT_EQ(settle(s, t0 + 300ms), 1);
    ASSERT_EQ(surface.shown.size(), 1u);
    EXPECT_EQ(surface.shown[0].generation, 2u);
    // No retry of the failed snapshot
    EXPECT_EQ(engine.seen(), std::vector<int>({1, 2}));
}

TEST(RenderScheduler, EngineExceptionBecomesError)
{
    GatedEngine      engine;
    engine.throw_tag = 7;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    const auto t0 = Clock::now();

    s.request_render(tagged(7), t0);
    s.poll(t0 + 100ms);
    EXPECT_EQ(settle(s, t0 + 110ms), 1);
    ASSERT_EQ(surface.errors.size(), 1u);
    EXPECT_EQ(surface.errors[0].message, "engine exploded");
    EXPECT_EQ(s.state(), SchedulerState::Idle);

    // Still usable afterwards
    s.request_render(tagged(8), t0 + 200ms);
    s.poll(t0 + 300ms);
    EXPECT_EQ(settle(s, t0 + 310ms), 1);
    EXPECT_EQ(surface.shown.size(), 1u);
}

TEST(RenderScheduler, SingleFlightWithMonotonicGenerations)
{
    GatedEngine engine;
    engine.delay = 2ms;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);

    auto t = Clock::now();
    for (int i = 1; i <= 30; ++i) {
        s.request_render(tagged(i), t);
        t += (i % 3 == 0) ? 150ms : 20ms;
        s.poll(t);
    }
    for (int guard = 0; guard < 200 && s.state() != SchedulerState::Idle; ++guard) {
        t += 150ms;
        if (s.busy())
            s.wait_for_completion(1000ms);
        s.poll(t);
    }

    ASSERT_EQ(s.state(), SchedulerState::Idle);
    EXPECT_EQ(engine.peak(), 1);
    ASSERT_FALSE(surface.shown.empty());
    EXPECT_EQ(surface.shown.back().viewport.max_iterations, 30);
    for (size_t k = 1; k < surface.shown.size(); ++k)
        EXPECT_GT(surface.shown[k].generation, surface.shown[k - 1].generation);
    EXPECT_EQ(s.last_generation(), s.dispatched_count());
    EXPECT_LT(s.dispatched_count(), 30u);
}

TEST(RenderScheduler, WatchdogAbandonsSlowRender)
{
    GatedEngine engine(true);
    RecordingSurface surface;
    SchedulerConfig cfg;
    cfg.render_timeout = 50ms;
    RenderScheduler s(engine, surface, cfg);
    const auto t0 = Clock::now();

    s.request_render(tagged(1), t0);
    s.poll(t0 + 100ms);
    ASSERT_TRUE(engine.wait_started(1));

    EXPECT_EQ(s.poll(t0 + 140ms), 0);
    EXPECT_EQ(s.poll(t0 + 150ms), 1);
    ASSERT_EQ(surface.errors.size(), 1u);
    EXPECT_EQ(surface.errors[0].generation, 1u);
    EXPECT_NE(surface.errors[0].message.find("timed out"), std::string::npos);
    EXPECT_EQ(s.state(), SchedulerState::Idle);

    // The worker is still busy with generation 1, so the new snapshot waits.
    s.request_render(tagged(2), t0 + 160ms);
    EXPECT_EQ(s.state(), SchedulerState::RenderingWithPending);
    EXPECT_TRUE(s.busy());
    s.poll(t0 + 260ms);
    EXPECT_EQ(s.dispatched_count(), 1u);

    // The abandoned render returns; its result is dropped and the
    // waiting snapshot goes out.
    engine.release();
    EXPECT_EQ(settle(s, t0 + 270ms), 0);
    EXPECT_TRUE(surface.shown.empty());
    EXPECT_EQ(s.current_generation(), 2u);

    engine.release();
    EXPECT_EQ(settle(s, t0 + 280ms), 1);
    ASSERT_EQ(surface.shown.size(), 1u);
    EXPECT_EQ(surface.shown[0].generation, 2u);
    EXPECT_EQ(surface.shown[0].viewport.max_iterations, 2);
    EXPECT_EQ(surface.errors.size(), 1u);
    EXPECT_EQ(engine.peak(), 1);
    EXPECT_EQ(s.state(), SchedulerState::Idle);
}

TEST(RenderScheduler, FollowUpAfterTimeoutGetsItsOwnBudget)
{
    GatedEngine engine(true);
    RecordingSurface surface;
    SchedulerConfig cfg;
    cfg.debounce       = 0ms;
    cfg.render_timeout = 100ms;
    RenderScheduler s(engine, surface, cfg);
    const auto t0 = Clock::now();

    s.request_render(tagged(1), t0);
    s.poll(t0);
    ASSERT_TRUE(engine.wait_started(1));
    s.request_render(tagged(2), t0 + 10ms);
    EXPECT_EQ(s.poll(t0 + 100ms), 1);   // generation 1 times out
    EXPECT_EQ(s.dispatched_count(), 1u);

    // Generation 1 hogs the worker well past the point where generation 2
    // would have timed out had its clock started at the abandonment.
    EXPECT_EQ(s.poll(t0 + 250ms), 0);
    engine.release();
    EXPECT_EQ(settle(s, t0 + 300ms), 0);
    ASSERT_TRUE(engine.wait_started(2));
    EXPECT_EQ(s.current_generation(), 2u);

    // 80 ms of its own work fits the 100 ms budget.
    EXPECT_EQ(s.poll(t0 + 380ms), 0);
    engine.release();
    EXPECT_EQ(settle(s, t0 + 390ms), 1);

    ASSERT_EQ(surface.shown.size(), 1u);
    EXPECT_EQ(surface.shown[0].generation, 2u);
    ASSERT_EQ(surface.errors.size(), 1u);
    EXPECT_EQ(surface.errors[0].generation, 1u);
    EXPECT_EQ(s.state(), SchedulerState::Idle);
}

TEST(RenderScheduler, TimeUntilDeadline)
{
    GatedEngine      engine;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    const auto t0 = Clock::now();

    EXPECT_EQ(s.time_until_deadline(t0, 50ms), 50ms);

    s.request_render(tagged(1), t0);
    EXPECT_EQ(s.time_until_deadline(t0 + 40ms, 50ms), 50ms);
    EXPECT_EQ(s.time_until_deadline(t0 + 90ms, 50ms), 11ms);
    EXPECT_EQ(s.time_until_deadline(t0 + 100ms, 50ms), 0ms);
}

TEST(RenderScheduler, DebounceIsConfigurable)
{
    GatedEngine      engine;
    RecordingSurface surface;
    SchedulerConfig  cfg;
    cfg.debounce = 0ms;
    RenderScheduler  s(engine, surface, cfg);
    const auto t0 = Clock::now();

    s.request_render(tagged(5), t0);
    s.poll(t0);
    EXPECT_EQ(s.dispatched_count(), 1u);
    EXPECT_EQ(settle(s, t0), 1);

    s.set_debounce(30ms);
    EXPECT_EQ(s.config().debounce, 30ms);
    s.request_render(tagged(6), t0);
    s.poll(t0 + 29ms);
    EXPECT_EQ(s.dispatched_count(), 1u);
    s.poll(t0 + 30ms);
    EXPECT_EQ(s.dispatched_count(), 2u);
    EXPECT_EQ(settle(s, t0 + 31ms), 1);
}

TEST(RenderScheduler, WakeupRunsAfterCompletion)
{
    GatedEngine      engine;
    RecordingSurface surface;
    RenderScheduler  s(engine, surface);
    std::atomic<int> wakes{0};
    s.set_wakeup([&wakes] { ++wakes; });
    const auto t0 = Clock::now();

    s.request_render(tagged(1), t0);
    s.poll(t0 + 100ms);
    ASSERT_TRUE(s.wait_for_completion(5000ms));
    for (int guard = 0; guard < 500 && wakes.load() == 0; ++guard)
        std::this_thread::sleep_for(1ms);
    EXPECT_EQ(wakes.load(), 1);
    EXPECT_EQ(s.poll(t0 + 110ms), 1);
}

TEST(RenderScheduler, DestroyWithRenderInFlight)
{
    GatedEngine      engine(true);
    RecordingSurface surface;
    {
        RenderScheduler s(engine, surface);
        const auto t0 = Clock::now();
        s.request_render(tagged(1), t0);
        s.poll(t0 + 100ms);
        ASSERT_TRUE(engine.wait_started(1));
        engine.release();
    }
    EXPECT_TRUE(surface.shown.empty());
    EXPECT_TRUE(surface.errors.empty());
}
