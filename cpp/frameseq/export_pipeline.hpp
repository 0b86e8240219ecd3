#ifndef FRAMESEQ_EXPORT_PIPELINE_HPP
#define FRAMESEQ_EXPORT_PIPELINE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "encoder.hpp"
#include "source_decoder.hpp"
#include "types.hpp"

namespace frameseq {

struct ExportProgress {
    enum class Stage {
        Prepare,
        Encode,
    };

    Stage stage = Stage::Prepare;
    size_t processed = 0;
    size_t total = 0;

    double fraction() const { return total == 0 ? 0.0 : static_cast<double>(processed) / total; }

    // Prepare covers [0, 0.5], Encode covers [0.5, 1].
    double overall() const { return stage == Stage::Prepare ? fraction() * 0.5 : 0.5 + fraction() * 0.5; }
};

using ExportProgressCallback = std::function<void(const ExportProgress&)>;

// Decode and resample run on up to settings.threads workers; encoding is
// strictly in sequence order on the calling thread. Progress callbacks are
// serialised but may come from worker threads during Prepare.
class ExportPipeline {
public:
    ExportPipeline(const SourceDecoder& decoder, const Encoder& encoder);

    // Throws DecodeError or ResizeError carrying the lowest failing frame
    // index, EncodeError, CancelledError, EmptyProjectError or
    // InvalidSettingError. decoded receives the canonical buffer of every
    // frame that was decoded, indexed like frames.
    std::vector<uint8_t> run(const FrameSequence& frames, const ExportSettings& settings,
        const ExportProgressCallback& progress, const std::atomic<bool>& cancel,
        std::vector<std::shared_ptr<const PixelBuffer>>& decoded) const;

    // Decode + resample only. Same failure rules as run().
    std::vector<PixelBuffer> prepare(const FrameSequence& frames, const ExportSettings& settings,
        const ExportProgressCallback& progress, const std::atomic<bool>& cancel,
        std::vector<std::shared_ptr<const PixelBuffer>>& decoded) const;

private:
    const SourceDecoder& decoder_;
    const Encoder& encoder_;
};

} // namespace frameseq

#endif
