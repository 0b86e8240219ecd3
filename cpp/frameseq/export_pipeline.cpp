#include "export_pipeline.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

#include "errors.hpp"
#include "logger.hpp"
#include "resampler.hpp"
#include "settings.hpp"

namespace frameseq {

ExportPipeline::ExportPipeline(const SourceDecoder& decoder, const Encoder& encoder)
    : decoder_(decoder)
    , encoder_(encoder)
{
}

std::vector<PixelBuffer> ExportPipeline::prepare(const FrameSequence& frames, const ExportSettings& settings,
    const ExportProgressCallback& progress, const std::atomic<bool>& cancel,
    std::vector<std::shared_ptr<const PixelBuffer>>& decoded) const
{
    auto total = frames.size();
    std::vector<PixelBuffer> resampled(total);
    decoded.assign(total, nullptr);

    std::atomic<size_t> next { 0 };
    std::atomic<bool> failed { false };
    std::mutex mutex;
    size_t completed = 0;
    size_t failedIndex = total;
    std::exception_ptr failure;

    // Indices are claimed in order, so every index below a failure has been
    // started and finishes; keeping the lowest failing index is deterministic.
    auto recordFailure = [&](size_t i, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex);
        if (i < failedIndex) {
            failedIndex = i;
            failure = error;
        }
        failed = true;
    };

    auto worker = [&]() {
        while (!cancel.load() && !failed.load()) {
            auto i = next.fetch_add(1);
            if (i >= total) {
                return;
            }

            const auto& frame = frames[i];
            try {
                auto canonical = frame.canonical;
                if (!canonical) {
                    canonical = std::make_shared<const PixelBuffer>(decoder_.decode(frame));
                }
                decoded[i] = canonical;
                resampled[i] = resample(*canonical, settings.resolution, settings.optimize);
            } catch (DecodeError& e) {
                e.setFrameIndex(i);
                recordFailure(i, std::current_exception());
                continue;
            } catch (ResizeError& e) {
                e.setFrameIndex(i);
                recordFailure(i, std::current_exception());
                continue;
            } catch (const std::exception& e) {
                DecodeError error(frame.reference, e.what());
                error.setFrameIndex(i);
                recordFailure(i, std::make_exception_ptr(error));
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex);
            completed++;
            if (progress) {
                progress(ExportProgress { ExportProgress::Stage::Prepare, completed, total });
            }
        }
    };

    auto threads = static_cast<size_t>(std::max(1, settings.threads));
    threads = std::min(threads, std::max<size_t>(total, 1));
    FRAMESEQ_LOG_DEBUG("export", "preparing {} frames on {} threads", total, threads);

    std::vector<std::thread> workers;
    workers.reserve(threads);
    try {
        for (size_t t = 1; t < threads; t++) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        // Run with the workers that did start.
        FRAMESEQ_LOG_WARN("export", "started {} of {} threads: {}", workers.size() + 1, threads, e.what());
    }

    worker();
    for (auto& w : workers) {
        w.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (cancel.load()) {
        throw CancelledError();
    }
    return resampled;
}

std::vector<uint8_t> ExportPipeline::run(const FrameSequence& frames, const ExportSettings& settings,
    const ExportProgressCallback& progress, const std::atomic<bool>& cancel,
    std::vector<std::shared_ptr<const PixelBuffer>>& decoded) const
{
    validateSettings(settings);
    if (frames.empty()) {
        throw EmptyProjectError();
    }

    auto resampled = prepare(frames, settings, progress, cancel, decoded);

    ProgressCallback encodeProgress;
    if (progress) {
        encodeProgress = [&progress](size_t processed, size_t total) {
            progress(ExportProgress { ExportProgress::Stage::Encode, processed, total });
        };
    }
    return encoder_.encode(resampled, encodeOptionsFrom(settings), encodeProgress, &cancel);
}

} // namespace frameseq
