#include <cstring>
#include <webp/encode.h>
#include <webp/mux.h>

#include "encoder.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace frameseq {

namespace {

class WebPWriter : public AnimationWriter {
public:
    WebPWriter(cv::Size canvas, const EncodeOptions& options)
        : width_(canvas.width)
        , height_(canvas.height)
    {
        if (!WebPAnimEncoderOptionsInit(&animConfig_) || !WebPConfigInit(&config_)) {
            throw EncodeError(0, "Library version mismatch.");
        }

        animConfig_.allow_mixed = 0;
        animConfig_.anim_params.loop_count = options.loopCount;
        // Stored as [Blue, Green, Red, Alpha] from the most significant byte.
        animConfig_.anim_params.bgcolor = (static_cast<uint32_t>(options.background.b) << 24)
            | (static_cast<uint32_t>(options.background.g) << 16)
            | (static_cast<uint32_t>(options.background.r) << 8)
            | 0xffu;

        config_.lossless = 0;
        config_.quality = static_cast<float>(options.quality);
        config_.method = options.optimize ? 6 : 4;
        config_.thread_level = 0;

        if (!WebPValidateConfig(&config_)) {
            throw EncodeError(0, "Invalid WebP Config");
        }

        encoder_ = WebPAnimEncoderNew(width_, height_, &animConfig_);
        if (!encoder_) {
            throw EncodeError(0, "Could not create WebPAnimEncoder object.");
        }
    }

    ~WebPWriter() override
    {
        if (encoder_) {
            WebPAnimEncoderDelete(encoder_);
        }
    }

    void addFrame(size_t index, const PixelBuffer& rgb, int timestampMs) override
    {
        WebPPicture pic;
        if (!WebPPictureInit(&pic)) {
            throw EncodeError(index, "Library version mismatch.");
        }
        pic.use_argb = 1;
        pic.width = width_;
        pic.height = height_;

        auto ok = WebPPictureImportRGB(&pic, rgb.data, static_cast<int>(rgb.step));
        ok = ok && WebPAnimEncoderAdd(encoder_, &pic, timestampMs, &config_);
        if (!ok) {
            std::string cause = "WebP error " + std::to_string(pic.error_code);
            auto detail = WebPAnimEncoderGetError(encoder_);
            if (detail && std::strlen(detail) > 0) {
                cause += ": " + std::string(detail);
            }
            WebPPictureFree(&pic);
            throw EncodeError(index, cause);
        }

        WebPPictureFree(&pic);
        lastIndex_ = index;
    }

    std::vector<uint8_t> finish(int endTimestampMs) override
    {
        WebPData webpData;
        WebPDataInit(&webpData);

        auto ok = WebPAnimEncoderAdd(encoder_, NULL, endTimestampMs, NULL);
        ok = ok && WebPAnimEncoderAssemble(encoder_, &webpData);
        if (!ok) {
            std::string cause = "Error during final animation assembly.";
            auto detail = WebPAnimEncoderGetError(encoder_);
            if (detail && std::strlen(detail) > 0) {
                cause += " " + std::string(detail);
            }
            WebPDataClear(&webpData);
            throw EncodeError(lastIndex_, cause);
        }

        std::vector<uint8_t> bytes(webpData.bytes, webpData.bytes + webpData.size);
        WebPDataClear(&webpData);
        return bytes;
    }

private:
    int width_;
    int height_;
    size_t lastIndex_ = 0;
    WebPAnimEncoderOptions animConfig_;
    WebPConfig config_;
    WebPAnimEncoder* encoder_ = nullptr;
};

}

std::unique_ptr<AnimationWriter> createWebPWriter(cv::Size canvas, const EncodeOptions& options)
{
    FRAMESEQ_LOG_DEBUG("encoder", "webp quality {}, method {}", options.quality, options.optimize ? 6 : 4);
    return std::make_unique<WebPWriter>(canvas, options);
}

} // namespace frameseq
