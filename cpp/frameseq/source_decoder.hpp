#ifndef FRAMESEQ_SOURCE_DECODER_HPP
#define FRAMESEQ_SOURCE_DECODER_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace frameseq {

// Maps a reference to a decoder branch by extension, or nullopt if neither
// branch accepts it.
std::optional<SourceFormat> classifySource(const std::string& reference);

// Converts an OpenCV-loaded image (gray, BGR or BGRA, 8 or 16 bit) into the
// canonical RGB buffer. Alpha is composited onto the background.
PixelBuffer flattenToCanonical(const cv::Mat& image, Color background);

class SourceDecoder {
public:
    explicit SourceDecoder(Color background = Color {});

    Color background() const { return background_; }
    void setBackground(Color background) { background_ = background; }

    // Cheap check that the reference is readable and recognised. Throws
    // DecodeError, returns the branch that will decode it.
    SourceFormat probe(const std::string& reference) const;

    PixelBuffer decode(const std::string& reference) const;
    PixelBuffer decode(const Frame& frame) const;

private:
    PixelBuffer decodeStandard(const std::string& reference) const;
    PixelBuffer decodeRawSensor(const std::string& reference) const;

    Color background_;
};

} // namespace frameseq

#endif
