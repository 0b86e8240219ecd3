#ifndef FRAMESEQ_PROJECT_CONTROLLER_HPP
#define FRAMESEQ_PROJECT_CONTROLLER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "encoder.hpp"
#include "export_pipeline.hpp"
#include "frame_store.hpp"
#include "history_manager.hpp"
#include "playback_controller.hpp"
#include "scheduler.hpp"
#include "source_decoder.hpp"
#include "types.hpp"

namespace frameseq {

enum class ExportStatus {
    Ok,
    EmptyProject,
    InvalidSettings,
    DecodeFailed,
    ResizeFailed,
    EncodeFailed,
    IoFailed,
    Cancelled,
    Busy,
};

std::string exportStatusName(ExportStatus status);

struct ExportResult {
    ExportStatus status = ExportStatus::Ok;
    std::string message;
    std::optional<size_t> frameIndex;
    std::string reference;
    size_t bytesWritten = 0;

    bool ok() const { return status == ExportStatus::Ok; }
};

// Owns the project: frames, history, export settings and preview playback.
// Frame mutations are rejected with ExportInProgressError while an export
// runs. Callbacks are never invoked with internal locks held.
class ProjectController {
public:
    explicit ProjectController(Scheduler& scheduler, Encoder encoder = Encoder());
    ~ProjectController();

    ProjectController(const ProjectController&) = delete;
    ProjectController& operator=(const ProjectController&) = delete;

    // Probes every path first; one bad path throws DecodeError and leaves the
    // project unchanged.
    FrameSequence addFrames(const std::vector<std::string>& paths);

    // Throws IndexError.
    FrameSequence removeFrame(size_t index);
    FrameSequence moveFrame(size_t from, size_t to);

    HistoryResult undo();
    HistoryResult redo();
    void resetHistory();

    // Drops every frame and the history.
    void close();

    FrameSequence frames() const;
    size_t frameCount() const;
    bool canUndo() const;
    bool canRedo() const;

    // Setters throw InvalidSettingError and keep the previous value.
    void setFps(int fps);
    void setLoopCount(int loopCount);
    void setResolution(const ResolutionTarget& resolution);
    void setOptimize(bool optimize);
    void setQuality(int quality);
    void setFormat(OutputFormat format);
    void setThreads(int threads);
    void setBackground(Color background);
    ExportSettings settings() const;

    // Selected/preview frame, shared with playback.
    size_t currentIndex() const;
    void select(size_t index);
    PlaybackController& playback() { return playback_; }

    // Decoded (cached) and shrunk to fit box. Throws IndexError, DecodeError.
    PixelBuffer previewFrame(size_t index, cv::Size box);

    // Takes a snapshot of the frames and settings, exports it and writes
    // destination atomically. Never leaves a partial file at destination.
    ExportResult exportTo(const std::filesystem::path& destination, const ExportProgressCallback& progress = {});

    // Observed by a running export at the next frame boundary. Only stores
    // an atomic flag, safe to call from a signal handler.
    void cancelExport();
    bool exporting() const { return exporting_.load(); }

    void setFramesChangedCallback(FrameStore::ChangeListener callback);

private:
    void requireIdleLocked() const;
    void commitLocked(ActionKind kind, FrameSequence before);
    void syncPlayback(std::optional<size_t> select);
    void dispatchChanges();

    mutable std::mutex mutex_;
    FrameStore store_;
    HistoryManager history_;
    ExportSettings settings_;
    Encoder encoder_;
    PlaybackController playback_;

    struct Preview {
        cv::Size box;
        PixelBuffer buffer;
    };
    std::map<size_t, Preview> previews_;

    // Bumped whenever cached buffers become stale; a decode started under an
    // older value is not cached.
    uint64_t cacheGeneration_ = 0;

    std::vector<std::pair<size_t, size_t>> pendingChanges_;
    FrameStore::ChangeListener changedCallback_;

    std::atomic<bool> exporting_ { false };
    std::atomic<bool> cancel_ { false };
};

} // namespace frameseq

#endif
