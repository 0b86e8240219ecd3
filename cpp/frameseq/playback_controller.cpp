#include "playback_controller.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logger.hpp"
#include "settings.hpp"

namespace frameseq {

PlaybackController::PlaybackController(Scheduler& scheduler, int fps)
    : scheduler_(scheduler)
    , fps_(fps)
{
    validateFps(fps);
}

PlaybackController::~PlaybackController()
{
    std::unique_lock<std::mutex> lock(mutex_);
    state_ = State::Stopped;
    cancelTimer(lock);
}

void PlaybackController::play()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Playing || count_ == 0) {
        return;
    }
    state_ = State::Playing;
    scheduleLocked();
    FRAMESEQ_LOG_DEBUG("playback", "playing {} frames at {} fps", count_, fps_);
}

void PlaybackController::pause()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == State::Stopped) {
        return;
    }
    state_ = State::Stopped;
    cancelTimer(lock);
    FRAMESEQ_LOG_DEBUG("playback", "paused at frame #{}", index_);
}

void PlaybackController::stop()
{
    pause();

    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_ == 0) {
            return;
        }
        index_ = 0;
        index = index_;
    }
    notify(index);
}

void PlaybackController::togglePlay()
{
    if (playing()) {
        pause();
    } else {
        play();
    }
}

void PlaybackController::next()
{
    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ == 0) {
            return;
        }
        index_ = (index_ + 1) % count_;
        index = index_;
    }
    notify(index);
}

void PlaybackController::prev()
{
    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ == 0) {
            return;
        }
        index_ = (index_ + count_ - 1) % count_;
        index = index_;
    }
    notify(index);
}

void PlaybackController::setFps(int fps)
{
    validateFps(fps);
    std::lock_guard<std::mutex> lock(mutex_);
    fps_ = fps;
}

int PlaybackController::fps() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return fps_;
}

void PlaybackController::setFrameCount(size_t count)
{
    std::unique_lock<std::mutex> lock(mutex_);
    count_ = count;
    if (count_ == 0) {
        index_ = 0;
        if (state_ == State::Playing) {
            state_ = State::Stopped;
            cancelTimer(lock);
        }
    } else if (index_ >= count_) {
        index_ = count_ - 1;
    }
}

size_t PlaybackController::frameCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

void PlaybackController::setIndex(size_t index)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= count_) {
            throw IndexError(index, count_);
        }
        index_ = index;
    }
    notify(index);
}

size_t PlaybackController::index() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index_;
}

PlaybackController::State PlaybackController::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void PlaybackController::setIndexChangedCallback(IndexChanged callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void PlaybackController::scheduleLocked()
{
    auto period = std::chrono::milliseconds(playbackPeriodMs(fps_));
    auto generation = ++generation_;
    timer_ = scheduler_.scheduleOnce(period, [this, generation] { onTick(generation); });
}

void PlaybackController::cancelTimer(std::unique_lock<std::mutex>& lock)
{
    auto timer = timer_;
    timer_ = 0;
    ++generation_;
    if (timer == 0) {
        return;
    }
    // The tick takes mutex_, so waiting for it must happen unlocked.
    lock.unlock();
    scheduler_.cancel(timer);
    lock.lock();
}

void PlaybackController::onTick(uint64_t generation)
{
    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Playing || generation != generation_ || count_ == 0) {
            return;
        }
        index_ = (index_ + 1) % count_;
        index = index_;
        scheduleLocked();
    }
    notify(index);
}

void PlaybackController::notify(size_t index)
{
    IndexChanged callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(index);
    }
}

} // namespace frameseq
