#ifndef FRAMESEQ_ENCODER_HPP
#define FRAMESEQ_ENCODER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "types.hpp"

namespace frameseq {

struct EncodeOptions {
    int fps = 24;
    int loopCount = 0;
    OutputFormat format = OutputFormat::GIF;
    bool optimize = true;
    int quality = 85;
    Color background;
};

EncodeOptions encodeOptionsFrom(const ExportSettings& settings);

// Throws InvalidSettingError. Called before any frame is touched.
void validateEncodeOptions(const EncodeOptions& options);

// Spacing between frame timestamps in milliseconds. GIF delays are
// quantised to whole hundredths first so all frames carry the same value.
int frameIntervalMs(const EncodeOptions& options);

// One container being written. Frames arrive in order at canvas size.
// Implementations throw EncodeError.
class AnimationWriter {
public:
    virtual ~AnimationWriter() = default;

    virtual void addFrame(size_t index, const PixelBuffer& rgb, int timestampMs) = 0;

    // endTimestampMs is the end of the last frame's display time.
    virtual std::vector<uint8_t> finish(int endTimestampMs) = 0;
};

using WriterFactory = std::function<std::unique_ptr<AnimationWriter>(cv::Size canvas, const EncodeOptions& options)>;

std::unique_ptr<AnimationWriter> createGifWriter(cv::Size canvas, const EncodeOptions& options);
std::unique_ptr<AnimationWriter> createWebPWriter(cv::Size canvas, const EncodeOptions& options);

// Dispatches on options.format.
std::unique_ptr<AnimationWriter> createWriter(cv::Size canvas, const EncodeOptions& options);

using ProgressCallback = std::function<void(size_t processed, size_t total)>;

class Encoder {
public:
    explicit Encoder(WriterFactory factory = createWriter);

    // Muxes frames in the given order. The canvas is the first frame's size;
    // other sizes are fitted and centred on it. cancel is polled between
    // frames. Throws EmptyProjectError, InvalidSettingError, EncodeError or
    // CancelledError; nothing is returned unless every frame was written.
    std::vector<uint8_t> encode(const std::vector<PixelBuffer>& frames, const EncodeOptions& options,
        const ProgressCallback& progress = {}, const std::atomic<bool>* cancel = nullptr) const;

private:
    WriterFactory factory_;
};

} // namespace frameseq

#endif
