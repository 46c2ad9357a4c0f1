#include <utility>

#include <cellsim/csimexcept.hpp>

#include "threading/threading.hpp"

using namespace csim::threading::impl;
using namespace csim::threading;
using namespace csim;

task notification_queue::try_pop() {
    lock q_lock{q_mutex_, std::try_to_lock};

    if (q_lock && !q_tasks_.empty()) {
        task tsk = std::move(q_tasks_.front());
        q_tasks_.pop_front();
        return tsk;
    }
    return {};
}

task notification_queue::pop() {
    lock q_lock{q_mutex_};

    while (q_tasks_.empty() && !quit_) {
        q_tasks_available_.wait(q_lock);
    }
    if (q_tasks_.empty()) return {};

    task tsk = std::move(q_tasks_.front());
    q_tasks_.pop_front();
    return tsk;
}

bool notification_queue::try_push(task& tsk) {
    {
        lock q_lock{q_mutex_, std::try_to_lock};
        if (!q_lock) return false;
        q_tasks_.push_back(std::move(tsk));
    }
    q_tasks_available_.notify_all();
    return true;
}

void notification_queue::push(task&& tsk) {
    {
        lock q_lock{q_mutex_};
        q_tasks_.push_back(std::move(tsk));
    }
    q_tasks_available_.notify_all();
}

void notification_queue::quit() {
    {
        lock q_lock{q_mutex_};
        quit_ = true;
    }
    q_tasks_available_.notify_all();
}

thread_local int task_system::current_task_queue_ = -1;

task_system::task_system(): task_system(1) {}

task_system::task_system(int nthreads):
    count_(nthreads>0? nthreads: 0),
    q_(count_)
{
    if (nthreads<=0) {
        throw bad_parameter("threads", nthreads);
    }

    for (unsigned i = 1; i<count_; ++i) {
        threads_.emplace_back([this, i] { run_tasks_loop(i); });
    }
}

task_system::~task_system() {
    for (auto& q: q_) q.quit();
    for (auto& t: threads_) t.join();
}

void task_system::run_tasks_loop(int index) {
    current_task_queue_ = index;
    while (true) {
        task tsk;
        // Steal from the other queues before blocking on our own.
        for (unsigned n = 0; n<count_ && !tsk; ++n) {
            tsk = q_[(index+n)%count_].try_pop();
        }
        if (!tsk) tsk = q_[index].pop();
        if (!tsk) break;

        tsk();
    }
    current_task_queue_ = -1;
}

bool task_system::try_run_task() {
    unsigned i = current_task_queue_<0? 0: current_task_queue_;

    for (unsigned n = 0; n<count_; ++n) {
        if (auto tsk = q_[(i+n)%count_].try_pop()) {
            tsk();
            return true;
        }
    }
    return false;
}

void task_system::async(task tsk) {
    auto i = index_++;

    for (unsigned n = 0; n<count_; ++n) {
        if (q_[(i+n)%count_].try_push(tsk)) return;
    }
    q_[i%count_].push(std::move(tsk));
}
