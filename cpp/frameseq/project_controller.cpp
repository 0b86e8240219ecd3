#include "project_controller.hpp"

#include <algorithm>

#include "errors.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "resampler.hpp"
#include "settings.hpp"

namespace frameseq {

namespace {

// Runs fn, logging a rejected call once before the error reaches the caller.
template <typename Fn>
decltype(auto) logged(const char* operation, Fn&& fn)
{
    try {
        return fn();
    } catch (const Error& e) {
        FRAMESEQ_LOG_ERROR("controller", "{} failed: {}", operation, e.what());
        throw;
    }
}

}

std::string exportStatusName(ExportStatus status)
{
    switch (status) {
    case ExportStatus::Ok:
        return "ok";
    case ExportStatus::EmptyProject:
        return "empty project";
    case ExportStatus::InvalidSettings:
        return "invalid settings";
    case ExportStatus::DecodeFailed:
        return "decode failed";
    case ExportStatus::ResizeFailed:
        return "resize failed";
    case ExportStatus::EncodeFailed:
        return "encode failed";
    case ExportStatus::IoFailed:
        return "write failed";
    case ExportStatus::Cancelled:
        return "cancelled";
    case ExportStatus::Busy:
        return "export in progress";
    }
    return "unknown";
}

ProjectController::ProjectController(Scheduler& scheduler, Encoder encoder)
    : encoder_(std::move(encoder))
    , playback_(scheduler, settings_.fps)
{
    store_.setChangeListener([this](size_t first, size_t last) {
        auto it = previews_.lower_bound(first);
        while (it != previews_.end() && it->first < last) {
            it = previews_.erase(it);
        }
        pendingChanges_.emplace_back(first, last);
    });
}

ProjectController::~ProjectController()
{
    playback_.pause();
}

void ProjectController::requireIdleLocked() const
{
    if (exporting_.load()) {
        throw ExportInProgressError();
    }
}

void ProjectController::commitLocked(ActionKind kind, FrameSequence before)
{
    history_.record(kind, std::move(before), store_.frames());
}

FrameSequence ProjectController::addFrames(const std::vector<std::string>& paths)
{
    return logged("add frames", [&]() {
        SourceDecoder decoder;
        FrameSequence added;
        added.reserve(paths.size());
        for (const auto& path : paths) {
            Frame frame;
            frame.reference = path;
            frame.format = decoder.probe(path);
            added.push_back(std::move(frame));
        }

        FrameSequence result;
        size_t first;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireIdleLocked();
            if (added.empty()) {
                return store_.frames();
            }
            auto before = store_.frames();
            first = before.size();
            result = store_.append(added);
            commitLocked(ActionKind::AddFrames, std::move(before));
        }

        FRAMESEQ_LOG_INFO("controller", "added {} frames", added.size());
        syncPlayback(first);
        dispatchChanges();
        return result;
    });
}

FrameSequence ProjectController::removeFrame(size_t index)
{
    return logged("remove frame", [&]() {
        FrameSequence result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireIdleLocked();
            auto before = store_.frames();
            result = store_.removeAt(index);
            commitLocked(ActionKind::RemoveFrame, std::move(before));
        }

        std::optional<size_t> select;
        if (!result.empty()) {
            select = std::min(index, result.size() - 1);
        }
        syncPlayback(select);
        dispatchChanges();
        return result;
    });
}

FrameSequence ProjectController::moveFrame(size_t from, size_t to)
{
    return logged("move frame", [&]() {
        FrameSequence result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireIdleLocked();
            auto before = store_.frames();
            if (from >= before.size()) {
                throw IndexError(from, before.size());
            }
            if (to >= before.size()) {
                throw IndexError(to, before.size());
            }
            if (from == to) {
                return before;
            }
            result = store_.move(from, to);
            commitLocked(ActionKind::MoveFrame, std::move(before));
        }

        syncPlayback(to);
        dispatchChanges();
        return result;
    });
}

HistoryResult ProjectController::undo()
{
    return logged("undo", [&]() {
        HistoryResult res;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireIdleLocked();
            FrameSequence restored;
            res = history_.undo(restored);
            if (res == HistoryResult::Applied) {
                store_.replace(std::move(restored));
            }
        }

        if (res == HistoryResult::Applied) {
            syncPlayback(0);
            dispatchChanges();
        }
        return res;
    });
}

HistoryResult ProjectController::redo()
{
    return logged("redo", [&]() {
        HistoryResult res;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireIdleLocked();
            FrameSequence restored;
            res = history_.redo(restored);
            if (res == HistoryResult::Applied) {
                store_.replace(std::move(restored));
            }
        }

        if (res == HistoryResult::Applied) {
            syncPlayback(0);
            dispatchChanges();
        }
        return res;
    });
}

void ProjectController::resetHistory()
{
    std::lock_guard<std::mutex> lock(mutex_);
    history_.reset();
}

void ProjectController::close()
{
    logged("close", [&]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireIdleLocked();
            store_.replace(FrameSequence());
            history_.reset();
        }
        playback_.stop();
        syncPlayback(std::nullopt);
        dispatchChanges();
    });
}

FrameSequence ProjectController::frames() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.frames();
}

size_t ProjectController::frameCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.size();
}

bool ProjectController::canUndo() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.canUndo();
}

bool ProjectController::canRedo() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.canRedo();
}

void ProjectController::setFps(int fps)
{
    logged("set fps", [&]() {
        validateFps(fps);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settings_.fps = fps;
        }
        playback_.setFps(fps);
    });
}

void ProjectController::setLoopCount(int loopCount)
{
    logged("set loop count", [&]() {
        validateLoopCount(loopCount);
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.loopCount = loopCount;
    });
}

void ProjectController::setResolution(const ResolutionTarget& resolution)
{
    logged("set resolution", [&]() {
        validateResolution(resolution);
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.resolution = resolution;
    });
}

void ProjectController::setOptimize(bool optimize)
{
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.optimize = optimize;
}

void ProjectController::setQuality(int quality)
{
    logged("set quality", [&]() {
        validateQuality(quality);
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.quality = quality;
    });
}

void ProjectController::setFormat(OutputFormat format)
{
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.format = format;
}

void ProjectController::setThreads(int threads)
{
    logged("set threads", [&]() {
        if (threads <= 0) {
            throw InvalidSettingError("threads", std::to_string(threads) + " is not a positive thread count");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.threads = threads;
    });
}

void ProjectController::setBackground(Color background)
{
    logged("set background", [&]() {
        std::lock_guard<std::mutex> lock(mutex_);
        requireIdleLocked();
        settings_.background = background;

        // Cached buffers were flattened onto the old colour, including those
        // held by history snapshots.
        for (size_t i = 0; i < store_.size(); i++) {
            store_.setCanonical(i, nullptr);
        }
        history_.clearCachedBuffers();
        previews_.clear();
        cacheGeneration_++;
    });
}

ExportSettings ProjectController::settings() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

size_t ProjectController::currentIndex() const
{
    return playback_.index();
}

void ProjectController::select(size_t index)
{
    logged("select", [&]() {
        playback_.setIndex(index);
    });
}

PixelBuffer ProjectController::previewFrame(size_t index, cv::Size box)
{
    return logged("preview", [&]() {
        Frame frame;
        Color background;
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            frame = store_.at(index);
            auto it = previews_.find(index);
            if (it != previews_.end() && it->second.box == box) {
                return it->second.buffer;
            }
            background = settings_.background;
            generation = cacheGeneration_;
        }

        auto canonical = frame.canonical;
        if (!canonical) {
            canonical = std::make_shared<const PixelBuffer>(SourceDecoder(background).decode(frame));
        }
        auto preview = fitWithin(*canonical, box);

        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == cacheGeneration_ && index < store_.size() && store_.at(index) == frame) {
            store_.setCanonical(index, canonical);
            previews_[index] = Preview { box, preview };
        }
        return preview;
    });
}

ExportResult ProjectController::exportTo(const std::filesystem::path& destination, const ExportProgressCallback& progress)
{
    ExportResult result;

    FrameSequence snapshot;
    ExportSettings settings;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exporting_.load()) {
            result.status = ExportStatus::Busy;
            result.message = ExportInProgressError().what();
            return result;
        }
        snapshot = store_.frames();
        settings = settings_;
        generation = cacheGeneration_;
        exporting_ = true;
        cancel_ = false;
    }

    struct ExportingGuard {
        std::atomic<bool>& flag;
        ~ExportingGuard() { flag = false; }
    } guard { exporting_ };

    FRAMESEQ_LOG_INFO("export", "exporting {} frames to \"{}\"", snapshot.size(), destination.string());

    std::vector<std::shared_ptr<const PixelBuffer>> decoded;
    try {
        SourceDecoder decoder(settings.background);
        ExportPipeline pipeline(decoder, encoder_);
        auto bytes = pipeline.run(snapshot, settings, progress, cancel_, decoded);
        writeFileAtomic(destination, bytes);
        result.bytesWritten = bytes.size();
    } catch (const EmptyProjectError& e) {
        result.status = ExportStatus::EmptyProject;
        result.message = e.what();
    } catch (const InvalidSettingError& e) {
        result.status = ExportStatus::InvalidSettings;
        result.message = e.what();
    } catch (const DecodeError& e) {
        result.status = ExportStatus::DecodeFailed;
        result.message = e.what();
        result.frameIndex = e.frameIndex();
        result.reference = e.reference();
    } catch (const ResizeError& e) {
        result.status = ExportStatus::ResizeFailed;
        result.message = e.what();
        result.frameIndex = e.frameIndex();
        if (e.frameIndex() && *e.frameIndex() < snapshot.size()) {
            result.reference = snapshot[*e.frameIndex()].reference;
        }
    } catch (const EncodeError& e) {
        result.status = ExportStatus::EncodeFailed;
        result.message = e.what();
        result.frameIndex = e.frameIndex();
        if (e.frameIndex() < snapshot.size()) {
            result.reference = snapshot[e.frameIndex()].reference;
        }
    } catch (const CancelledError& e) {
        result.status = ExportStatus::Cancelled;
        result.message = e.what();
    } catch (const Error& e) {
        result.status = ExportStatus::IoFailed;
        result.message = e.what();
    } catch (const std::exception& e) {
        // Decode and resize failures are already wrapped by the pipeline, so
        // anything else comes from muxing (OpenCV or allocation failures).
        result.status = ExportStatus::EncodeFailed;
        result.message = e.what();
    }

    if (!result.ok()) {
        std::error_code ec;
        std::filesystem::remove(partialPath(destination), ec);
        if (result.status == ExportStatus::Cancelled) {
            FRAMESEQ_LOG_INFO("export", "export to \"{}\" cancelled", destination.string());
        } else {
            FRAMESEQ_LOG_ERROR("export", "export to \"{}\" failed: {}", destination.string(), result.message);
        }
    } else {
        FRAMESEQ_LOG_INFO("export", "wrote {} bytes to \"{}\"", result.bytesWritten, destination.string());
    }

    // Keep whatever was decoded; the sequence cannot have changed meanwhile.
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != cacheGeneration_) {
        return result;
    }
    for (size_t i = 0; i < decoded.size() && i < store_.size(); i++) {
        if (decoded[i] && !store_.at(i).canonical && store_.at(i) == snapshot[i]) {
            store_.setCanonical(i, decoded[i]);
        }
    }
    return result;
}

void ProjectController::cancelExport()
{
    cancel_ = true;
}

void ProjectController::setFramesChangedCallback(FrameStore::ChangeListener callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    changedCallback_ = std::move(callback);
}

void ProjectController::syncPlayback(std::optional<size_t> select)
{
    auto count = frameCount();
    playback_.setFrameCount(count);
    if (select && *select < count) {
        playback_.setIndex(*select);
    }
}

void ProjectController::dispatchChanges()
{
    std::vector<std::pair<size_t, size_t>> changes;
    FrameStore::ChangeListener callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changes.swap(pendingChanges_);
        callback = changedCallback_;
    }
    if (!callback) {
        return;
    }
    for (const auto& change : changes) {
        callback(change.first, change.second);
    }
}

} // namespace frameseq
