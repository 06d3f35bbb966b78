#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of workers draining a FIFO. With one worker, tasks run strictly
// one after another in submission order. The first exception thrown by a
// task is kept and rethrown from wait().
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        workers.reserve(n_threads);
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Runs every queued task before joining.
    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    void submit(std::function<void()> f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    void wait()
    {
        std::exception_ptr err;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv_done.wait(lock, [this] { return pending == 0; });
            std::swap(err, first_error);
        }
        if (err) std::rethrow_exception(err);
    }

    int size() const { return static_cast<int>(workers.size()); }

    // Drops tasks that no worker has picked up yet and returns how many.
    // Tasks already running are unaffected.
    int discard_queued()
    {
        std::lock_guard<std::mutex> lock(mtx);
        const int n = static_cast<int>(tasks.size());
        tasks.clear();
        pending -= n;
        if (pending == 0) cv_done.notify_all();
        return n;
    }

private:
    void worker_loop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_task.wait(lock, [this] { return !tasks.empty() || stopping; });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            std::exception_ptr err;
            try {
                task();
            } catch (...) {
                err = std::current_exception();
            }
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (err && !first_error) first_error = err;
                if (--pending == 0) cv_done.notify_all();
            }
        }
    }

    std::vector<std::thread>          workers;
    std::deque<std::function<void()>> tasks;
    std::mutex                        mtx;
    std::condition_variable           cv_task;
    std::condition_variable           cv_done;
    std::exception_ptr                first_error;
    int                               pending  = 0;
    bool                              stopping = false;
};
