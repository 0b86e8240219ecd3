#include "history_manager.hpp"

#include "logger.hpp"

namespace frameseq {

std::string actionName(ActionKind kind)
{
    switch (kind) {
    case ActionKind::AddFrames:
        return "add_frames";
    case ActionKind::RemoveFrame:
        return "remove_frame";
    case ActionKind::MoveFrame:
        return "move_frame";
    }
    return "unknown";
}

void HistoryManager::record(ActionKind kind, FrameSequence before, FrameSequence after)
{
    redoStack_.clear();
    undoStack_.push_back(HistoryEntry { kind, std::move(before), std::move(after) });
    FRAMESEQ_LOG_DEBUG("history", "recorded {} (undo depth {})", actionName(kind), undoStack_.size());
}

HistoryResult HistoryManager::undo(FrameSequence& restored)
{
    if (undoStack_.empty()) {
        FRAMESEQ_LOG_DEBUG("history", "nothing to undo");
        return HistoryResult::Underflow;
    }

    auto entry = std::move(undoStack_.back());
    undoStack_.pop_back();
    restored = entry.before;
    FRAMESEQ_LOG_DEBUG("history", "undo {}", actionName(entry.kind));
    redoStack_.push_back(std::move(entry));
    return HistoryResult::Applied;
}

HistoryResult HistoryManager::redo(FrameSequence& restored)
{
    if (redoStack_.empty()) {
        FRAMESEQ_LOG_DEBUG("history", "nothing to redo");
        return HistoryResult::Underflow;
    }

    auto entry = std::move(redoStack_.back());
    redoStack_.pop_back();
    restored = entry.after;
    FRAMESEQ_LOG_DEBUG("history", "redo {}", actionName(entry.kind));
    undoStack_.push_back(std::move(entry));
    return HistoryResult::Applied;
}

void HistoryManager::reset()
{
    undoStack_.clear();
    redoStack_.clear();
}

void HistoryManager::clearCachedBuffers()
{
    for (auto* stack : { &undoStack_, &redoStack_ }) {
        for (auto& entry : *stack) {
            for (auto& frame : entry.before) {
                frame.canonical.reset();
            }
            for (auto& frame : entry.after) {
                frame.canonical.reset();
            }
        }
    }
}

const HistoryEntry* HistoryManager::peekUndo() const
{
    return undoStack_.empty() ? nullptr : &undoStack_.back();
}

const HistoryEntry* HistoryManager::peekRedo() const
{
    return redoStack_.empty() ? nullptr : &redoStack_.back();
}

} // namespace frameseq
