#ifndef FRAMESEQ_PLAYBACK_CONTROLLER_HPP
#define FRAMESEQ_PLAYBACK_CONTROLLER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>

#include "scheduler.hpp"

namespace frameseq {

// Steps a preview index through the frame sequence. Reads only the frame
// count; never touches the sequence itself.
class PlaybackController {
public:
    enum class State {
        Stopped,
        Playing,
    };

    using IndexChanged = std::function<void(size_t index)>;

    explicit PlaybackController(Scheduler& scheduler, int fps = 24);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    void play();
    void pause();

    // Like pause(), and rewinds to the first frame.
    void stop();
    void togglePlay();

    // Circular steps; no-ops on an empty sequence.
    void next();
    void prev();

    // Applies from the next scheduled tick.
    void setFps(int fps);
    int fps() const;

    // Clamps the index into the new range; stops playback when it drops to 0.
    void setFrameCount(size_t count);
    size_t frameCount() const;

    // Throws IndexError.
    void setIndex(size_t index);
    size_t index() const;

    State state() const;
    bool playing() const { return state() == State::Playing; }

    void setIndexChangedCallback(IndexChanged callback);

private:
    void scheduleLocked();
    void cancelTimer(std::unique_lock<std::mutex>& lock);
    void onTick(uint64_t generation);
    void notify(size_t index);

    Scheduler& scheduler_;
    mutable std::mutex mutex_;
    State state_ = State::Stopped;
    int fps_;
    size_t count_ = 0;
    size_t index_ = 0;
    Scheduler::TimerId timer_ = 0;
    uint64_t generation_ = 0;
    IndexChanged callback_;
};

} // namespace frameseq

#endif
