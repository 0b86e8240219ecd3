#ifndef FRAMESEQ_TYPES_HPP
#define FRAMESEQ_TYPES_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <thread>
#include <vector>

namespace frameseq {

enum class SourceFormat {
    Standard = 1,
    RawSensor = 2,
};

enum class OutputFormat {
    GIF = 1,
    WEBP = 2,
};

// Canonical buffers are CV_8UC3 in RGB channel order.
using PixelBuffer = cv::Mat;

struct Frame {
    std::string reference;
    SourceFormat format = SourceFormat::Standard;

    // Lazily decoded canonical buffer. Shared between snapshots, never
    // mutated once populated.
    std::shared_ptr<const PixelBuffer> canonical;
};

// Cache state is ignored: two frames are equal when they name the same source.
inline bool operator==(const Frame& a, const Frame& b)
{
    return a.reference == b.reference && a.format == b.format;
}

inline bool operator!=(const Frame& a, const Frame& b)
{
    return !(a == b);
}

using FrameSequence = std::vector<Frame>;

class ResolutionTarget {
public:
    static ResolutionTarget original() { return ResolutionTarget(false, 0); }

    // Not checked here; validateResolution() rejects a non-positive height.
    static ResolutionTarget height(int h) { return ResolutionTarget(true, h); }

    bool isOriginal() const { return !explicit_; }
    int outputHeight() const { return height_; }

    bool operator==(const ResolutionTarget& other) const { return explicit_ == other.explicit_ && height_ == other.height_; }
    bool operator!=(const ResolutionTarget& other) const { return !(*this == other); }

private:
    ResolutionTarget(bool isExplicit, int h)
        : explicit_(isExplicit)
        , height_(h)
    {
    }

    bool explicit_;
    int height_;
};

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

constexpr int kOptimizeMaxEdge = 800;
constexpr int kMinQuality = 1;
constexpr int kMaxQuality = 100;
constexpr int kMaxLoopCount = 32767;

struct ExportSettings {
    int fps = 24;
    int loopCount = 0;
    ResolutionTarget resolution = ResolutionTarget::original();
    bool optimize = true;
    int quality = 85;
    OutputFormat format = OutputFormat::GIF;
    int threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    Color background;
};

} // namespace frameseq

#endif
