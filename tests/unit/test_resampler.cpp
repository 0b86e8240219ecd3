#include <cmath>
#include <gtest/gtest.h>

#include "frameseq/errors.hpp"
#include "frameseq/resampler.hpp"
#include "util/image_fixtures.hpp"

using namespace frameseq;
using frameseq::test::solidRgb;

// ─── Target size ─────────────────────────────────────────────────────────────

TEST(Resampler, OriginalKeepsSize)
{
    EXPECT_EQ(resampledSize({ 1920, 1080 }, ResolutionTarget::original(), false), cv::Size(1920, 1080));
}

TEST(Resampler, ExplicitHeightDerivesWidth)
{
    EXPECT_EQ(resampledSize({ 1920, 1080 }, ResolutionTarget::height(720), false), cv::Size(1280, 720));
    EXPECT_EQ(resampledSize({ 1920, 1080 }, ResolutionTarget::height(360), false), cv::Size(640, 360));
}

TEST(Resampler, DerivedWidthIsRounded)
{
    // 100 * 1000 / 333 = 300.3
    EXPECT_EQ(resampledSize({ 1000, 333 }, ResolutionTarget::height(100), false), cv::Size(300, 100));
    // 100 * 1000 / 1501 = 66.62
    EXPECT_EQ(resampledSize({ 1000, 1501 }, ResolutionTarget::height(100), false), cv::Size(67, 100));
}

TEST(Resampler, AspectRatioWithinOnePixel)
{
    const cv::Size sources[] = { { 1920, 1080 }, { 1080, 1920 }, { 4032, 3024 }, { 333, 777 }, { 5, 3 }, { 6000, 4000 } };
    for (auto source : sources) {
        for (int h = 1; h <= 2200; h += 37) {
            cv::Size out;
            try {
                out = resampledSize(source, ResolutionTarget::height(h), false);
            } catch (const ResizeError&) {
                continue;
            }
            auto exact = static_cast<double>(h) * source.width / source.height;
            EXPECT_EQ(out.height, h);
            EXPECT_LE(std::abs(out.width - exact), 1.0) << source << " -> " << h;
        }
    }
}

TEST(Resampler, OptimizeCapsLongerEdge)
{
    EXPECT_EQ(resampledSize({ 4000, 3000 }, ResolutionTarget::original(), true), cv::Size(800, 600));
    EXPECT_EQ(resampledSize({ 1000, 2000 }, ResolutionTarget::original(), true), cv::Size(400, 800));
    EXPECT_EQ(resampledSize({ 640, 480 }, ResolutionTarget::original(), true), cv::Size(640, 480));
}

TEST(Resampler, OptimizeAppliesAfterHeight)
{
    EXPECT_EQ(resampledSize({ 1920, 1080 }, ResolutionTarget::height(1080), true), cv::Size(800, 450));
    EXPECT_EQ(resampledSize({ 1920, 1080 }, ResolutionTarget::height(360), true), cv::Size(640, 360));
}

TEST(Resampler, DegenerateSizesThrow)
{
    EXPECT_THROW(resampledSize({ 0, 100 }, ResolutionTarget::original(), false), ResizeError);
    EXPECT_THROW(resampledSize({ 100, 0 }, ResolutionTarget::height(10), false), ResizeError);
    // width rounds to 0
    EXPECT_THROW(resampledSize({ 1, 10000 }, ResolutionTarget::height(100), false), ResizeError);
    // cap drives the short edge to 0
    EXPECT_THROW(resampledSize({ 10000, 1 }, ResolutionTarget::original(), true), ResizeError);
}

// ─── Pixel work ──────────────────────────────────────────────────────────────

TEST(Resampler, OriginalReturnsSameBuffer)
{
    auto in = solidRgb(64, 48, 10, 20, 30);
    auto out = resample(in, ResolutionTarget::original(), false);
    EXPECT_EQ(out.data, in.data);
}

TEST(Resampler, UpscaleAndDownscaleProduceTargetSize)
{
    auto in = solidRgb(100, 50, 200, 100, 50);

    auto up = resample(in, ResolutionTarget::height(200), false);
    EXPECT_EQ(up.size(), cv::Size(400, 200));
    EXPECT_EQ(up.type(), CV_8UC3);

    auto down = resample(in, ResolutionTarget::height(10), false);
    EXPECT_EQ(down.size(), cv::Size(20, 10));

    // A flat colour survives Lanczos untouched.
    auto px = down.at<cv::Vec3b>(5, 10);
    EXPECT_NEAR(px[0], 200, 1);
    EXPECT_NEAR(px[1], 100, 1);
    EXPECT_NEAR(px[2], 50, 1);
}

TEST(Resampler, FittedSizeNeverUpscales)
{
    EXPECT_EQ(fittedSize({ 100, 50 }, { 400, 400 }), cv::Size(100, 50));
    EXPECT_EQ(fittedSize({ 400, 200 }, { 100, 100 }), cv::Size(100, 50));
    EXPECT_EQ(fittedSize({ 200, 400 }, { 100, 100 }), cv::Size(50, 100));
}

TEST(Resampler, PlaceOnCanvasCentresAndFills)
{
    auto in = solidRgb(200, 100, 255, 255, 255);
    Color background { 0, 0, 255 };

    auto out = placeOnCanvas(in, { 100, 100 }, background);
    ASSERT_EQ(out.size(), cv::Size(100, 100));

    // 100x50 image centred vertically: rows 25..74.
    EXPECT_EQ(out.at<cv::Vec3b>(0, 50), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(out.at<cv::Vec3b>(99, 50), cv::Vec3b(0, 0, 255));
    auto centre = out.at<cv::Vec3b>(50, 50);
    EXPECT_GE(centre[0], 250);
    EXPECT_GE(centre[1], 250);
    EXPECT_GE(centre[2], 250);
}

TEST(Resampler, PlaceOnCanvasSameSizeIsNoOp)
{
    auto in = solidRgb(32, 32, 1, 2, 3);
    auto out = placeOnCanvas(in, { 32, 32 }, Color {});
    EXPECT_EQ(out.data, in.data);
}
