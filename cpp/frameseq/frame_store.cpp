#include "frame_store.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logger.hpp"

namespace frameseq {

const Frame& FrameStore::at(size_t index) const
{
    if (index >= frames_.size()) {
        throw IndexError(index, frames_.size());
    }
    return frames_[index];
}

const FrameSequence& FrameStore::append(const FrameSequence& added)
{
    auto first = frames_.size();
    frames_.insert(frames_.end(), added.begin(), added.end());

    FRAMESEQ_LOG_DEBUG("store", "appended {} frames, {} total", added.size(), frames_.size());
    notify(first, frames_.size());
    return frames_;
}

const FrameSequence& FrameStore::removeAt(size_t index)
{
    if (index >= frames_.size()) {
        throw IndexError(index, frames_.size());
    }

    auto oldSize = frames_.size();
    frames_.erase(frames_.begin() + static_cast<std::ptrdiff_t>(index));

    FRAMESEQ_LOG_DEBUG("store", "removed frame #{}, {} left", index, frames_.size());
    notify(index, oldSize);
    return frames_;
}

const FrameSequence& FrameStore::move(size_t from, size_t to)
{
    if (from >= frames_.size()) {
        throw IndexError(from, frames_.size());
    }
    if (to >= frames_.size()) {
        throw IndexError(to, frames_.size());
    }
    if (from == to) {
        return frames_;
    }

    auto begin = frames_.begin();
    if (from < to) {
        std::rotate(begin + static_cast<std::ptrdiff_t>(from), begin + static_cast<std::ptrdiff_t>(from) + 1, begin + static_cast<std::ptrdiff_t>(to) + 1);
    } else {
        std::rotate(begin + static_cast<std::ptrdiff_t>(to), begin + static_cast<std::ptrdiff_t>(from), begin + static_cast<std::ptrdiff_t>(from) + 1);
    }

    FRAMESEQ_LOG_DEBUG("store", "moved frame #{} to #{}", from, to);
    notify(std::min(from, to), std::max(from, to) + 1);
    return frames_;
}

const FrameSequence& FrameStore::replace(FrameSequence frames)
{
    auto oldSize = frames_.size();
    frames_ = std::move(frames);
    notify(0, std::max(oldSize, frames_.size()));
    return frames_;
}

void FrameStore::setCanonical(size_t index, std::shared_ptr<const PixelBuffer> canonical)
{
    if (index >= frames_.size()) {
        throw IndexError(index, frames_.size());
    }
    frames_[index].canonical = std::move(canonical);
}

void FrameStore::notify(size_t first, size_t last) const
{
    if (listener_ && first < last) {
        listener_(first, last);
    }
}

} // namespace frameseq
