#include "scheduler.hpp"

#include <algorithm>

#include "logger.hpp"

namespace frameseq {

ThreadScheduler::ThreadScheduler()
    : worker_(&ThreadScheduler::run, this)
{
}

ThreadScheduler::~ThreadScheduler()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        pending_.clear();
    }
    wake_.notify_all();
    worker_.join();
}

Scheduler::TimerId ThreadScheduler::scheduleOnce(std::chrono::milliseconds delay, Callback callback)
{
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_++;
        pending_.emplace(id, Pending { Clock::now() + delay, std::move(callback) });
    }
    wake_.notify_all();
    return id;
}

void ThreadScheduler::cancel(TimerId id)
{
    std::unique_lock<std::mutex> lock(mutex_);
    pending_.erase(id);
    if (std::this_thread::get_id() != worker_.get_id()) {
        idle_.wait(lock, [&] { return running_ != id; });
    }
}

void ThreadScheduler::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (pending_.empty()) {
            wake_.wait(lock);
            continue;
        }

        auto next = std::min_element(pending_.begin(), pending_.end(), [](const auto& a, const auto& b) {
            return a.second.deadline < b.second.deadline;
        });

        if (Clock::now() < next->second.deadline) {
            wake_.wait_until(lock, next->second.deadline);
            continue;
        }

        auto id = next->first;
        auto callback = std::move(next->second.callback);
        pending_.erase(next);
        running_ = id;

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            FRAMESEQ_LOG_ERROR("playback", "timer callback failed: {}", e.what());
        }
        lock.lock();

        running_ = 0;
        idle_.notify_all();
    }
}

} // namespace frameseq
