#ifndef FRAMESEQ_HISTORY_MANAGER_HPP
#define FRAMESEQ_HISTORY_MANAGER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace frameseq {

enum class ActionKind {
    AddFrames,
    RemoveFrame,
    MoveFrame,
};

std::string actionName(ActionKind kind);

struct HistoryEntry {
    ActionKind kind;
    FrameSequence before;
    FrameSequence after;
};

enum class HistoryResult {
    Applied,
    Underflow,
};

// Full-snapshot undo/redo. Entries hold complete copies of the frame
// sequence; the caller applies the returned snapshot to its FrameStore.
class HistoryManager {
public:
    // Clears the redo stack.
    void record(ActionKind kind, FrameSequence before, FrameSequence after);

    // On Applied, restored holds the snapshot to install.
    HistoryResult undo(FrameSequence& restored);
    HistoryResult redo(FrameSequence& restored);

    void reset();

    // Drops the decoded buffer of every frame held in either stack.
    void clearCachedBuffers();

    bool canUndo() const { return !undoStack_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }
    size_t undoDepth() const { return undoStack_.size(); }
    size_t redoDepth() const { return redoStack_.size(); }

    const HistoryEntry* peekUndo() const;
    const HistoryEntry* peekRedo() const;

private:
    std::vector<HistoryEntry> undoStack_;
    std::vector<HistoryEntry> redoStack_;
};

} // namespace frameseq

#endif
