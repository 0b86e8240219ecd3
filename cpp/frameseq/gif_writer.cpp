#include <gifski.h>
#include <opencv2/imgproc.hpp>

#include "animation_info.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace frameseq {

namespace {

class GifWriter : public AnimationWriter {
public:
    GifWriter(cv::Size canvas, const EncodeOptions& options)
        : width_(canvas.width)
        , height_(canvas.height)
    {
        GifskiSettings settings;
        settings.quality = static_cast<uint8_t>(options.optimize ? options.quality : kMaxQuality);
        settings.fast = false;
        settings.height = height_;
        settings.width = width_;
        settings.repeat = static_cast<int16_t>(options.loopCount);

        handle_ = gifski_new(&settings);
        if (!handle_) {
            throw EncodeError(0, "GifSki init failed");
        }

        auto res = gifski_set_write_callback(handle_, &GifWriter::write, this);
        if (res != GIFSKI_OK) {
            gifski_finish(handle_);
            handle_ = nullptr;
            throw EncodeError(0, "GifSki failed to attach output: " + std::to_string(res));
        }
    }

    ~GifWriter() override
    {
        // gifski_finish is the only way to release the handle; on an aborted
        // export the partial output is dropped with this object.
        if (handle_) {
            gifski_finish(handle_);
        }
    }

    void addFrame(size_t index, const PixelBuffer& rgb, int timestampMs) override
    {
        cv::Mat rgba;
        cv::cvtColor(rgb, rgba, cv::COLOR_RGB2RGBA);

        auto res = gifski_add_frame_rgba(handle_, static_cast<uint32_t>(index), width_, height_, rgba.data, timestampMs / 1000.0);
        if (res != GIFSKI_OK) {
            throw EncodeError(index, "GifSki failed to add frame: " + std::to_string(res));
        }
        lastIndex_ = index;
    }

    std::vector<uint8_t> finish(int endTimestampMs) override
    {
        auto handle = handle_;
        handle_ = nullptr;

        auto res = gifski_finish(handle);
        if (res != GIFSKI_OK) {
            throw EncodeError(lastIndex_, "GifSki failed to finish: " + std::to_string(res));
        }
        if (writeFailed_) {
            throw EncodeError(lastIndex_, "GifSki output buffer error");
        }

        // gifski guesses the last frame's delay; pin it to the export timing.
        try {
            setGifDuration(output_, endTimestampMs / 10);
        } catch (const Error& e) {
            throw EncodeError(lastIndex_, e.what());
        }
        return std::move(output_);
    }

private:
    static int write(size_t length, const uint8_t* buffer, void* userData)
    {
        auto self = static_cast<GifWriter*>(userData);
        try {
            self->output_.insert(self->output_.end(), buffer, buffer + length);
        } catch (const std::bad_alloc&) {
            self->writeFailed_ = true;
            return 1;
        }
        return 0;
    }

    gifski* handle_ = nullptr;
    uint32_t width_;
    uint32_t height_;
    size_t lastIndex_ = 0;
    bool writeFailed_ = false;
    std::vector<uint8_t> output_;
};

}

std::unique_ptr<AnimationWriter> createGifWriter(cv::Size canvas, const EncodeOptions& options)
{
    FRAMESEQ_LOG_DEBUG("encoder", "gifski quality {}", options.optimize ? options.quality : kMaxQuality);
    return std::make_unique<GifWriter>(canvas, options);
}

} // namespace frameseq
