#ifndef FRAMESEQ_ANIMATION_INFO_HPP
#define FRAMESEQ_ANIMATION_INFO_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "types.hpp"

namespace frameseq {

struct AnimationInfo {
    OutputFormat format = OutputFormat::GIF;
    int width = 0;
    int height = 0;
    size_t frameCount = 0;

    // nullopt when the container carries no loop directive (GIF without a
    // NETSCAPE2.0 block plays once). 0 means forever.
    std::optional<int> loopCount;

    std::vector<int> delaysMs;
};

// Reads container metadata without decoding pixels. Throws Error on a
// malformed or unsupported container.
AnimationInfo inspectAnimation(const std::vector<uint8_t>& bytes);
AnimationInfo inspectAnimationFile(const std::filesystem::path& path);

// Rewrites the delay of the last GIF frame so the animation lasts totalCs
// hundredths of a second in all. Throws Error on a malformed stream.
void setGifDuration(std::vector<uint8_t>& bytes, int totalCs);

// Decodes every frame of an animated WebP to RGB buffers, in display order.
std::vector<PixelBuffer> decodeWebPFrames(const std::vector<uint8_t>& bytes);

} // namespace frameseq

#endif
