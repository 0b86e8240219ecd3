#ifndef FRAMESEQ_FRAME_STORE_HPP
#define FRAMESEQ_FRAME_STORE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "types.hpp"

namespace frameseq {

// The ordered frame collection. Every mutation either applies completely or
// throws before touching the sequence. A frame's position is its index.
class FrameStore {
public:
    // Half-open index range [first, last) whose derived data is stale.
    using ChangeListener = std::function<void(size_t first, size_t last)>;

    const FrameSequence& frames() const { return frames_; }
    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    const Frame& at(size_t index) const;

    const FrameSequence& append(const FrameSequence& added);
    const FrameSequence& removeAt(size_t index);
    const FrameSequence& move(size_t from, size_t to);

    // Used by history restore and project close.
    const FrameSequence& replace(FrameSequence frames);

    // Attaches a decoded buffer to the frame at index. Not a mutation of the
    // sequence, no change event.
    void setCanonical(size_t index, std::shared_ptr<const PixelBuffer> canonical);

    void setChangeListener(ChangeListener listener) { listener_ = std::move(listener); }

private:
    void notify(size_t first, size_t last) const;

    FrameSequence frames_;
    ChangeListener listener_;
};

} // namespace frameseq

#endif
