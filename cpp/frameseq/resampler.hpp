#ifndef FRAMESEQ_RESAMPLER_HPP
#define FRAMESEQ_RESAMPLER_HPP

#include "types.hpp"

namespace frameseq {

// Output size for a source of the given size. An explicit height derives the
// width as round(H * w / h); optimize then caps the longer edge at 800.
// Throws ResizeError when a computed dimension is not positive.
cv::Size resampledSize(cv::Size source, const ResolutionTarget& target, bool optimize);

// Lanczos resize to resampledSize(). Returns the input untouched when the
// size does not change.
PixelBuffer resample(const PixelBuffer& buffer, const ResolutionTarget& target, bool optimize);

// Largest aspect-preserving size that fits inside box. Never upscales.
cv::Size fittedSize(cv::Size source, cv::Size box);

PixelBuffer fitWithin(const PixelBuffer& buffer, cv::Size box);

// Centres buffer on a canvas of the given size, shrinking it first if it
// does not fit. Uncovered pixels take the background colour.
PixelBuffer placeOnCanvas(const PixelBuffer& buffer, cv::Size canvas, Color background);

} // namespace frameseq

#endif
