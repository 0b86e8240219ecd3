#include "resampler.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"
#include "logger.hpp"

namespace frameseq {

namespace {

int scaled(int value, double factor)
{
    return static_cast<int>(std::lround(value * factor));
}

PixelBuffer lanczos(const PixelBuffer& buffer, cv::Size size)
{
    if (buffer.size() == size) {
        return buffer;
    }
    PixelBuffer out;
    cv::resize(buffer, out, size, 0, 0, cv::INTER_LANCZOS4);
    return out;
}

}

cv::Size resampledSize(cv::Size source, const ResolutionTarget& target, bool optimize)
{
    if (source.width <= 0 || source.height <= 0) {
        throw ResizeError(source.width, source.height);
    }

    auto width = source.width;
    auto height = source.height;

    if (!target.isOriginal()) {
        height = target.outputHeight();
        width = static_cast<int>(std::lround(static_cast<double>(height) * source.width / source.height));
        if (width <= 0 || height <= 0) {
            throw ResizeError(width, height);
        }
    }

    if (optimize) {
        auto edge = std::max(width, height);
        if (edge > kOptimizeMaxEdge) {
            auto factor = static_cast<double>(kOptimizeMaxEdge) / edge;
            if (width >= height) {
                height = scaled(height, factor);
                width = kOptimizeMaxEdge;
            } else {
                width = scaled(width, factor);
                height = kOptimizeMaxEdge;
            }
            if (width <= 0 || height <= 0) {
                throw ResizeError(width, height);
            }
        }
    }

    return cv::Size(width, height);
}

PixelBuffer resample(const PixelBuffer& buffer, const ResolutionTarget& target, bool optimize)
{
    auto size = resampledSize(buffer.size(), target, optimize);
    FRAMESEQ_LOG_TRACE("resampler", "{}x{} -> {}x{}", buffer.cols, buffer.rows, size.width, size.height);
    return lanczos(buffer, size);
}

cv::Size fittedSize(cv::Size source, cv::Size box)
{
    if (source.width <= 0 || source.height <= 0) {
        throw ResizeError(source.width, source.height);
    }
    if (box.width <= 0 || box.height <= 0) {
        throw ResizeError(box.width, box.height);
    }
    if (source.width <= box.width && source.height <= box.height) {
        return source;
    }

    auto factor = std::min(static_cast<double>(box.width) / source.width, static_cast<double>(box.height) / source.height);
    auto width = std::clamp(scaled(source.width, factor), 1, box.width);
    auto height = std::clamp(scaled(source.height, factor), 1, box.height);
    return cv::Size(width, height);
}

PixelBuffer fitWithin(const PixelBuffer& buffer, cv::Size box)
{
    return lanczos(buffer, fittedSize(buffer.size(), box));
}

PixelBuffer placeOnCanvas(const PixelBuffer& buffer, cv::Size canvas, Color background)
{
    if (buffer.size() == canvas) {
        return buffer;
    }

    auto fitted = fitWithin(buffer, canvas);
    PixelBuffer out(canvas, CV_8UC3, cv::Scalar(background.r, background.g, background.b));
    auto x = (canvas.width - fitted.cols) / 2;
    auto y = (canvas.height - fitted.rows) / 2;
    fitted.copyTo(out(cv::Rect(x, y, fitted.cols, fitted.rows)));
    return out;
}

} // namespace frameseq
