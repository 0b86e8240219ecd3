#include "animation_info.hpp"

#include <algorithm>
#include <cstring>
#include <opencv2/imgproc.hpp>
#include <string>
#include <webp/demux.h>

#include "errors.hpp"
#include "file_io.hpp"

namespace frameseq {

namespace {

class GifReader {
public:
    explicit GifReader(const std::vector<uint8_t>& bytes)
        : bytes_(bytes)
    {
    }

    uint8_t byte()
    {
        require(1);
        return bytes_[pos_++];
    }

    int word()
    {
        require(2);
        auto value = bytes_[pos_] | (bytes_[pos_ + 1] << 8);
        pos_ += 2;
        return value;
    }

    void skip(size_t n)
    {
        require(n);
        pos_ += n;
    }

    std::string text(size_t n)
    {
        require(n);
        std::string s(reinterpret_cast<const char*>(bytes_.data() + pos_), n);
        pos_ += n;
        return s;
    }

    void skipSubBlocks()
    {
        while (true) {
            auto length = byte();
            if (length == 0) {
                return;
            }
            skip(length);
        }
    }

    bool done() const { return pos_ >= bytes_.size(); }
    size_t position() const { return pos_; }

private:
    void require(size_t n) const
    {
        if (pos_ + n > bytes_.size()) {
            throw Error("truncated GIF data");
        }
    }

    const std::vector<uint8_t>& bytes_;
    size_t pos_ = 0;
};

size_t colorTableSize(uint8_t packed)
{
    return 3u * (1u << ((packed & 0x07) + 1));
}

// delayOffsets receives, per image, the byte offset of the delay field of
// its graphic control extension, or npos when it has none.
AnimationInfo walkGif(const std::vector<uint8_t>& bytes, std::vector<size_t>* delayOffsets)
{
    AnimationInfo info;
    info.format = OutputFormat::GIF;

    GifReader reader(bytes);
    auto signature = reader.text(6);
    if (signature != "GIF87a" && signature != "GIF89a") {
        throw Error("not a GIF stream");
    }

    info.width = reader.word();
    info.height = reader.word();
    auto packed = reader.byte();
    reader.skip(2);
    if (packed & 0x80) {
        reader.skip(colorTableSize(packed));
    }

    auto pendingDelay = 0;
    auto pendingOffset = std::string::npos;
    while (!reader.done()) {
        auto introducer = reader.byte();
        if (introducer == 0x3B) {
            break;
        } else if (introducer == 0x21) {
            auto label = reader.byte();
            if (label == 0xF9) {
                auto size = reader.byte();
                if (size < 4) {
                    throw Error("malformed graphic control extension");
                }
                reader.skip(1);
                pendingOffset = reader.position();
                pendingDelay = reader.word() * 10;
                reader.skip(size - 3);
                reader.skipSubBlocks();
            } else if (label == 0xFF) {
                auto size = reader.byte();
                auto identifier = reader.text(size);
                if (identifier == "NETSCAPE2.0") {
                    auto length = reader.byte();
                    if (length >= 3) {
                        auto id = reader.byte();
                        auto loops = reader.word();
                        reader.skip(length - 3);
                        if (id == 1) {
                            info.loopCount = loops;
                        }
                    } else {
                        reader.skip(length);
                    }
                }
                reader.skipSubBlocks();
            } else {
                reader.skipSubBlocks();
            }
        } else if (introducer == 0x2C) {
            reader.skip(8);
            auto imagePacked = reader.byte();
            if (imagePacked & 0x80) {
                reader.skip(colorTableSize(imagePacked));
            }
            reader.skip(1);
            reader.skipSubBlocks();

            info.frameCount++;
            info.delaysMs.push_back(pendingDelay);
            if (delayOffsets) {
                delayOffsets->push_back(pendingOffset);
            }
            pendingDelay = 0;
            pendingOffset = std::string::npos;
        } else {
            throw Error("unexpected GIF block 0x" + std::to_string(introducer));
        }
    }

    return info;
}

AnimationInfo inspectGif(const std::vector<uint8_t>& bytes)
{
    return walkGif(bytes, nullptr);
}

AnimationInfo inspectWebP(const std::vector<uint8_t>& bytes)
{
    WebPData webpData;
    webpData.bytes = bytes.data();
    webpData.size = bytes.size();

    auto demux = WebPDemux(&webpData);
    if (!demux) {
        throw Error("failed to parse WebP container");
    }

    AnimationInfo info;
    info.format = OutputFormat::WEBP;
    info.width = static_cast<int>(WebPDemuxGetI(demux, WEBP_FF_CANVAS_WIDTH));
    info.height = static_cast<int>(WebPDemuxGetI(demux, WEBP_FF_CANVAS_HEIGHT));
    info.frameCount = WebPDemuxGetI(demux, WEBP_FF_FRAME_COUNT);
    if (WebPDemuxGetI(demux, WEBP_FF_FORMAT_FLAGS) & ANIMATION_FLAG) {
        info.loopCount = static_cast<int>(WebPDemuxGetI(demux, WEBP_FF_LOOP_COUNT));
    }

    WebPIterator iter;
    if (WebPDemuxGetFrame(demux, 1, &iter)) {
        do {
            info.delaysMs.push_back(iter.duration);
        } while (WebPDemuxNextFrame(&iter));
        WebPDemuxReleaseIterator(&iter);
    }

    WebPDemuxDelete(demux);
    return info;
}

bool isWebP(const std::vector<uint8_t>& bytes)
{
    return bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 && std::memcmp(bytes.data() + 8, "WEBP", 4) == 0;
}

}

AnimationInfo inspectAnimation(const std::vector<uint8_t>& bytes)
{
    if (bytes.size() >= 4 && std::memcmp(bytes.data(), "GIF8", 4) == 0) {
        return inspectGif(bytes);
    } else if (isWebP(bytes)) {
        return inspectWebP(bytes);
    }
    throw Error("unsupported container");
}

void setGifDuration(std::vector<uint8_t>& bytes, int totalCs)
{
    std::vector<size_t> offsets;
    auto info = walkGif(bytes, &offsets);
    if (offsets.empty() || offsets.back() == std::string::npos) {
        throw Error("last GIF frame has no graphic control extension");
    }

    auto elapsedCs = 0;
    for (size_t i = 0; i + 1 < info.delaysMs.size(); i++) {
        elapsedCs += info.delaysMs[i] / 10;
    }
    auto lastCs = std::min(std::max(1, totalCs - elapsedCs), 0xffff);

    auto offset = offsets.back();
    bytes[offset] = static_cast<uint8_t>(lastCs & 0xff);
    bytes[offset + 1] = static_cast<uint8_t>((lastCs >> 8) & 0xff);
}

AnimationInfo inspectAnimationFile(const std::filesystem::path& path)
{
    return inspectAnimation(readFile(path));
}

std::vector<PixelBuffer> decodeWebPFrames(const std::vector<uint8_t>& bytes)
{
    if (!isWebP(bytes)) {
        throw Error("not a WebP stream");
    }

    WebPData webpData;
    webpData.bytes = bytes.data();
    webpData.size = bytes.size();

    WebPAnimDecoderOptions options;
    if (!WebPAnimDecoderOptionsInit(&options)) {
        throw Error("Library version mismatch.");
    }
    options.color_mode = MODE_RGBA;

    auto dec = WebPAnimDecoderNew(&webpData, &options);
    if (!dec) {
        throw Error("failed to decode file.");
    }

    WebPAnimInfo animInfo;
    if (!WebPAnimDecoderGetInfo(dec, &animInfo)) {
        WebPAnimDecoderDelete(dec);
        throw Error("failed to get info file.");
    }

    std::vector<PixelBuffer> frames;
    auto frameIndex = 0;
    while (WebPAnimDecoderHasMoreFrames(dec)) {
        uint8_t* buffer = nullptr;
        int timestamp;

        if (!WebPAnimDecoderGetNext(dec, &buffer, &timestamp)) {
            WebPAnimDecoderDelete(dec);
            throw Error("failed to decode frame #" + std::to_string(frameIndex));
        }

        cv::Mat rgba(static_cast<int>(animInfo.canvas_height), static_cast<int>(animInfo.canvas_width), CV_8UC4, buffer);
        PixelBuffer rgb;
        cv::cvtColor(rgba, rgb, cv::COLOR_RGBA2RGB);
        frames.push_back(rgb);
        ++frameIndex;
    }

    WebPAnimDecoderDelete(dec);
    return frames;
}

} // namespace frameseq
