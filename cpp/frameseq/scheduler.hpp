#ifndef FRAMESEQ_SCHEDULER_HPP
#define FRAMESEQ_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace frameseq {

// One-shot delayed callbacks. Recurring work reschedules itself from the
// callback so a changed period applies from the next tick on.
class Scheduler {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TimerId scheduleOnce(std::chrono::milliseconds delay, Callback callback) = 0;

    // Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

// Runs callbacks on a single background thread.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    TimerId scheduleOnce(std::chrono::milliseconds delay, Callback callback) override;

    // Blocks while the callback for id is running on the worker, unless
    // called from that callback.
    void cancel(TimerId id) override;

private:
    using Clock = std::chrono::steady_clock;

    struct Pending {
        Clock::time_point deadline;
        Callback callback;
    };

    void run();

    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::map<TimerId, Pending> pending_;
    TimerId nextId_ = 1;
    TimerId running_ = 0;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace frameseq

#endif
