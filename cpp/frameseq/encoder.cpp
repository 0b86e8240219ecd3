#include "encoder.hpp"

#include "errors.hpp"
#include "logger.hpp"
#include "resampler.hpp"
#include "settings.hpp"

namespace frameseq {

namespace {

bool cancelled(const std::atomic<bool>* cancel)
{
    return cancel && cancel->load();
}

}

EncodeOptions encodeOptionsFrom(const ExportSettings& settings)
{
    EncodeOptions options;
    options.fps = settings.fps;
    options.loopCount = settings.loopCount;
    options.format = settings.format;
    options.optimize = settings.optimize;
    options.quality = settings.quality;
    options.background = settings.background;
    return options;
}

void validateEncodeOptions(const EncodeOptions& options)
{
    validateFps(options.fps);
    validateLoopCount(options.loopCount);
    validateQuality(options.quality);
}

int frameIntervalMs(const EncodeOptions& options)
{
    if (options.format == OutputFormat::GIF) {
        return frameDelayCs(options.fps) * 10;
    }
    return frameDelayMs(options.fps);
}

std::unique_ptr<AnimationWriter> createWriter(cv::Size canvas, const EncodeOptions& options)
{
    switch (options.format) {
    case OutputFormat::GIF:
        return createGifWriter(canvas, options);
    case OutputFormat::WEBP:
        return createWebPWriter(canvas, options);
    }
    throw InvalidSettingError("format", "unknown output format");
}

Encoder::Encoder(WriterFactory factory)
    : factory_(std::move(factory))
{
}

std::vector<uint8_t> Encoder::encode(const std::vector<PixelBuffer>& frames, const EncodeOptions& options,
    const ProgressCallback& progress, const std::atomic<bool>* cancel) const
{
    validateEncodeOptions(options);
    if (frames.empty()) {
        throw EmptyProjectError();
    }

    auto canvas = frames.front().size();
    if (canvas.width <= 0 || canvas.height <= 0) {
        throw EncodeError(0, "empty first frame");
    }

    auto interval = frameIntervalMs(options);
    FRAMESEQ_LOG_INFO("encoder", "encoding {} frames as {} {}x{}, {} ms per frame, loop {}",
        frames.size(), formatName(options.format), canvas.width, canvas.height, interval, options.loopCount);

    auto writer = factory_(canvas, options);
    if (!writer) {
        throw EncodeError(0, "no writer for " + formatName(options.format));
    }

    auto total = frames.size();
    auto ts = 0;
    for (size_t i = 0; i < total; i++) {
        if (cancelled(cancel)) {
            FRAMESEQ_LOG_INFO("encoder", "cancelled before frame #{}", i);
            throw CancelledError();
        }

        const auto& frame = frames[i];
        if (frame.empty() || frame.type() != CV_8UC3) {
            throw EncodeError(i, "frame is not an 8-bit RGB buffer");
        }

        PixelBuffer placed;
        try {
            placed = placeOnCanvas(frame, canvas, options.background);
        } catch (const cv::Exception& e) {
            throw EncodeError(i, e.what());
        } catch (const ResizeError& e) {
            throw EncodeError(i, e.what());
        }

        writer->addFrame(i, placed, ts);
        ts += interval;

        if (progress) {
            progress(i + 1, total);
        }
    }

    if (cancelled(cancel)) {
        FRAMESEQ_LOG_INFO("encoder", "cancelled before finalizing");
        throw CancelledError();
    }

    auto bytes = writer->finish(ts);
    FRAMESEQ_LOG_DEBUG("encoder", "assembled {} bytes", bytes.size());
    return bytes;
}

} // namespace frameseq
