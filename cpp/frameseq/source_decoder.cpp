#include "source_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <libraw/libraw.h>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "errors.hpp"
#include "logger.hpp"

namespace frameseq {

namespace {

void requireReadableFile(const std::string& reference)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(reference, ec)) {
        throw DecodeError(reference, "file does not exist or is not a regular file");
    }
}

}

std::optional<SourceFormat> classifySource(const std::string& reference)
{
    auto ext = std::filesystem::path(reference).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".gif") {
        return SourceFormat::Standard;
    } else if (ext == ".dng") {
        return SourceFormat::RawSensor;
    }
    return std::nullopt;
}

PixelBuffer flattenToCanonical(const cv::Mat& image, Color background)
{
    cv::Mat eightBit;
    if (image.depth() == CV_8U) {
        eightBit = image;
    } else if (image.depth() == CV_16U) {
        image.convertTo(eightBit, CV_8U, 1.0 / 257.0);
    } else if (image.depth() == CV_32F) {
        image.convertTo(eightBit, CV_8U, 255.0);
    } else {
        throw Error("unsupported sample depth " + std::to_string(image.depth()));
    }

    PixelBuffer rgb;
    switch (eightBit.channels()) {
    case 1:
        cv::cvtColor(eightBit, rgb, cv::COLOR_GRAY2RGB);
        break;
    case 3:
        cv::cvtColor(eightBit, rgb, cv::COLOR_BGR2RGB);
        break;
    case 4: {
        cv::Mat bgr, alpha;
        cv::cvtColor(eightBit, bgr, cv::COLOR_BGRA2BGR);
        cv::extractChannel(eightBit, alpha, 3);

        cv::Mat bgrF, alphaF, alpha3, inverse;
        bgr.convertTo(bgrF, CV_32FC3);
        alpha.convertTo(alphaF, CV_32F, 1.0 / 255.0);
        cv::merge(std::vector<cv::Mat> { alphaF, alphaF, alphaF }, alpha3);
        cv::subtract(cv::Scalar::all(1.0), alpha3, inverse);

        cv::Mat fill(eightBit.size(), CV_32FC3, cv::Scalar(background.b, background.g, background.r));
        cv::Mat composited = bgrF.mul(alpha3) + fill.mul(inverse);

        cv::Mat flattened;
        composited.convertTo(flattened, CV_8UC3);
        cv::cvtColor(flattened, rgb, cv::COLOR_BGR2RGB);
        break;
    }
    default:
        throw Error("unsupported channel count " + std::to_string(eightBit.channels()));
    }
    return rgb;
}

SourceDecoder::SourceDecoder(Color background)
    : background_(background)
{
}

SourceFormat SourceDecoder::probe(const std::string& reference) const
{
    auto format = classifySource(reference);
    if (!format) {
        throw DecodeError(reference, "unrecognized file extension");
    }

    requireReadableFile(reference);

    if (*format == SourceFormat::Standard) {
        bool recognised = false;
        try {
            recognised = cv::haveImageReader(reference);
        } catch (const cv::Exception& e) {
            throw DecodeError(reference, e.what());
        }
        if (!recognised) {
            throw DecodeError(reference, "no decoder recognises the file header");
        }
    } else {
        LibRaw processor;
        auto ret = processor.open_file(reference.c_str());
        if (ret != LIBRAW_SUCCESS) {
            throw DecodeError(reference, libraw_strerror(ret));
        }
    }
    return *format;
}

PixelBuffer SourceDecoder::decode(const std::string& reference) const
{
    auto format = classifySource(reference);
    if (!format) {
        throw DecodeError(reference, "unrecognized file extension");
    }

    Frame frame;
    frame.reference = reference;
    frame.format = *format;
    return decode(frame);
}

PixelBuffer SourceDecoder::decode(const Frame& frame) const
{
    requireReadableFile(frame.reference);

    auto buffer = frame.format == SourceFormat::RawSensor ? decodeRawSensor(frame.reference) : decodeStandard(frame.reference);
    FRAMESEQ_LOG_DEBUG("decoder", "decoded \"{}\" to {}x{}", frame.reference, buffer.cols, buffer.rows);
    return buffer;
}

PixelBuffer SourceDecoder::decodeStandard(const std::string& reference) const
{
    cv::Mat image;
    try {
        image = cv::imread(reference, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(reference, e.what());
    }

    if (!image.data) {
        throw DecodeError(reference, "invalid input image");
    }

    try {
        return flattenToCanonical(image, background_);
    } catch (const Error& e) {
        throw DecodeError(reference, e.what());
    }
}

PixelBuffer SourceDecoder::decodeRawSensor(const std::string& reference) const
{
    LibRaw processor;

    // White balance comes from the file so decode depends on nothing else.
    processor.imgdata.params.use_camera_wb = 1;
    processor.imgdata.params.output_bps = 8;
    processor.imgdata.params.output_color = 1;

    auto ret = processor.open_file(reference.c_str());
    if (ret != LIBRAW_SUCCESS) {
        throw DecodeError(reference, libraw_strerror(ret));
    }

    ret = processor.unpack();
    if (ret != LIBRAW_SUCCESS) {
        throw DecodeError(reference, libraw_strerror(ret));
    }

    ret = processor.dcraw_process();
    if (ret != LIBRAW_SUCCESS) {
        throw DecodeError(reference, libraw_strerror(ret));
    }

    int err = LIBRAW_SUCCESS;
    std::unique_ptr<libraw_processed_image_t, void (*)(libraw_processed_image_t*)> image(
        processor.dcraw_make_mem_image(&err), &LibRaw::dcraw_clear_mem);
    if (!image) {
        throw DecodeError(reference, libraw_strerror(err));
    }

    if (image->type != LIBRAW_IMAGE_BITMAP || image->colors != 3 || image->bits != 8) {
        throw DecodeError(reference, "unexpected demosaic output layout");
    }

    cv::Mat view(image->height, image->width, CV_8UC3, image->data);
    return view.clone();
}

} // namespace frameseq
