#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

// A small work-stealing pool for running independent jobs, such as the
// simulation of distinct circuits.

namespace csim {
namespace threading {

using std::mutex;
using lock = std::unique_lock<mutex>;
using std::condition_variable;
using task = std::function<void()>;

namespace impl {

class notification_queue {
public:
    // Pop a task if the lock can be taken without blocking and the queue
    // is not empty; otherwise return an empty task.
    task try_pop();

    // Wait for a task and pop it. Returns an empty task once the queue
    // has been told to quit and is drained.
    task pop();

    // Push if the lock can be taken without blocking. On success the
    // task is moved from.
    bool try_push(task& tsk);

    void push(task&& tsk);

    // Wake all waiting threads and stop blocking in pop().
    void quit();

private:
    std::deque<task> q_tasks_;
    mutex q_mutex_;
    condition_variable q_tasks_available_;
    bool quit_ = false;
};

} // namespace impl

class task_system {
public:
    // Pool of one: the calling thread does all the work.
    task_system();

    // Create nthreads-1 worker threads; the thread that waits on a task
    // group is the remaining worker.
    explicit task_system(int nthreads);

    task_system(const task_system&) = delete;
    task_system& operator=(const task_system&) = delete;

    // Joins the workers. Tasks still queued are not run.
    ~task_system();

    // Queue a task, balancing over the per-thread queues.
    void async(task tsk);

    // Run one queued task, if one is available.
    // Returns true if a task was run.
    bool try_run_task();

    int get_num_threads() const { return (int)count_; }

private:
    unsigned count_;
    std::vector<std::thread> threads_;
    std::vector<impl::notification_queue> q_;
    std::atomic<unsigned> index_{0};

    static thread_local int current_task_queue_;

    void run_tasks_loop(int i);
};

// A set of tasks that can be waited on together.
//
// The first exception raised by a task is rethrown by wait(); tasks not yet
// started when it is raised are skipped.
class task_group {
    struct exception_state {
        std::atomic<bool> error_{false};
        std::exception_ptr exception_;
        std::mutex mutex_;

        operator bool() const {
            return error_.load(std::memory_order_relaxed);
        }

        void set(std::exception_ptr ex) {
            error_.store(true, std::memory_order_relaxed);
            lock ex_lock{mutex_};
            if (!exception_) exception_ = std::move(ex);
        }

        std::exception_ptr reset() {
            lock ex_lock{mutex_};
            auto ex = std::move(exception_);
            exception_ = nullptr;
            error_.store(false, std::memory_order_relaxed);
            return ex;
        }
    };

    std::atomic<std::size_t> in_flight_{0};
    bool running_ = false;
    task_system* task_system_;
    exception_state exception_status_;

public:
    explicit task_group(task_system* ts): task_system_(ts) {}

    task_group(const task_group&) = delete;
    task_group& operator=(const task_group&) = delete;

    template <typename F>
    void run(F&& f) {
        running_ = true;
        ++in_flight_;
        task_system_->async(
            [f = std::forward<F>(f), &counter = in_flight_, &ex = exception_status_]() mutable {
                if (!ex) {
                    try {
                        f();
                    }
                    catch (...) {
                        ex.set(std::current_exception());
                    }
                }
                --counter;
            });
    }

    // Wait for all tasks in the group, helping to run queued tasks
    // meanwhile.
    void wait() {
        while (in_flight_) {
            if (!task_system_->try_run_task()) std::this_thread::yield();
        }
        running_ = false;

        if (auto ex = exception_status_.reset()) {
            std::rethrow_exception(ex);
        }
    }

    ~task_group() {
        if (running_) std::terminate();
    }
};

struct parallel_for {
    // Apply f to each index in [left, right), in batches of batch_size
    // indices per task.
    template <typename F>
    static void apply(int left, int right, int batch_size, task_system* ts, F f) {
        task_group g(ts);
        for (int i = left; i<right; i += batch_size) {
            g.run([=] {
                int r = i+batch_size<right? i+batch_size: right;
                for (int j = i; j<r; ++j) {
                    f(j);
                }
            });
        }
        g.wait();
    }

    template <typename F>
    static void apply(int left, int right, task_system* ts, F f) {
        apply(left, right, 1, ts, std::move(f));
    }
};

} // namespace threading
} // namespace csim
