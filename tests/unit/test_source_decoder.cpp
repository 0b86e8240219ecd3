#include <fstream>
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include "frameseq/encoder.hpp"
#include "frameseq/errors.hpp"
#include "frameseq/source_decoder.hpp"
#include "util/image_fixtures.hpp"
#include "util/temp_dir.hpp"

using namespace frameseq;
using namespace frameseq::test;

// ─── Classification ──────────────────────────────────────────────────────────

TEST(SourceDecoder, ClassifiesByExtension)
{
    EXPECT_EQ(classifySource("a.png"), SourceFormat::Standard);
    EXPECT_EQ(classifySource("a.JPG"), SourceFormat::Standard);
    EXPECT_EQ(classifySource("a.jpeg"), SourceFormat::Standard);
    EXPECT_EQ(classifySource("a.bmp"), SourceFormat::Standard);
    EXPECT_EQ(classifySource("a.gif"), SourceFormat::Standard);
    EXPECT_EQ(classifySource("/x/y/shot.DNG"), SourceFormat::RawSensor);
    EXPECT_FALSE(classifySource("notes.txt").has_value());
    EXPECT_FALSE(classifySource("noext").has_value());
}

// ─── Standard branch ─────────────────────────────────────────────────────────

TEST(SourceDecoder, DecodesPngToRgb)
{
    TempDir dir;
    auto path = writeSolid(dir.file("red.png"), 12, 8, 255, 0, 0);

    SourceDecoder decoder;
    EXPECT_EQ(decoder.probe(path), SourceFormat::Standard);

    auto buffer = decoder.decode(path);
    ASSERT_EQ(buffer.type(), CV_8UC3);
    EXPECT_EQ(buffer.cols, 12);
    EXPECT_EQ(buffer.rows, 8);
    EXPECT_EQ(buffer.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 0, 0));
}

TEST(SourceDecoder, DecodesJpegWithinTolerance)
{
    TempDir dir;
    auto path = writeSolid(dir.file("green.jpg"), 16, 16, 20, 200, 40);

    SourceDecoder decoder;
    EXPECT_EQ(decoder.probe(path), SourceFormat::Standard);

    auto px = decoder.decode(path).at<cv::Vec3b>(8, 8);
    EXPECT_NEAR(px[0], 20, 6);
    EXPECT_NEAR(px[1], 200, 6);
    EXPECT_NEAR(px[2], 40, 6);
}

TEST(SourceDecoder, DecodesBmp)
{
    TempDir dir;
    auto path = writeSolid(dir.file("blue.bmp"), 5, 3, 0, 0, 255);

    auto buffer = SourceDecoder().decode(path);
    ASSERT_EQ(buffer.size(), cv::Size(5, 3));
    EXPECT_EQ(buffer.at<cv::Vec3b>(1, 2), cv::Vec3b(0, 0, 255));
}

TEST(SourceDecoder, DecodesFirstFrameOfGif)
{
    TempDir dir;
    auto path = dir.file("still.gif");

    EncodeOptions options;
    options.format = OutputFormat::GIF;
    options.optimize = false;
    auto bytes = Encoder().encode({ solidRgb(10, 6, 250, 250, 0) }, options);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    SourceDecoder decoder;
    EXPECT_EQ(decoder.probe(path), SourceFormat::Standard);

    auto buffer = decoder.decode(path);
    ASSERT_EQ(buffer.type(), CV_8UC3);
    ASSERT_EQ(buffer.size(), cv::Size(10, 6));
    auto px = buffer.at<cv::Vec3b>(3, 5);
    EXPECT_NEAR(px[0], 250, 8);
    EXPECT_NEAR(px[1], 250, 8);
    EXPECT_NEAR(px[2], 0, 8);
}

TEST(SourceDecoder, MixedCaseExtensions)
{
    TempDir dir;
    auto jpg = writeSolid(dir.file("Shot.JPG"), 4, 4, 128, 128, 128);
    auto bmp = writeSolid(dir.file("Shot.Bmp"), 4, 4, 1, 2, 3);

    SourceDecoder decoder;
    EXPECT_EQ(decoder.probe(jpg), SourceFormat::Standard);
    EXPECT_EQ(decoder.probe(bmp), SourceFormat::Standard);
    EXPECT_EQ(decoder.decode(bmp).at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));
}

TEST(SourceDecoder, GrayscaleExpandsToRgb)
{
    TempDir dir;
    auto path = dir.file("gray.png");
    cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(77));
    ASSERT_TRUE(cv::imwrite(path, gray));

    auto buffer = SourceDecoder().decode(path);
    ASSERT_EQ(buffer.type(), CV_8UC3);
    EXPECT_EQ(buffer.at<cv::Vec3b>(1, 1), cv::Vec3b(77, 77, 77));
}

TEST(SourceDecoder, SixteenBitScalesDown)
{
    TempDir dir;
    auto path = dir.file("deep.png");
    cv::Mat deep(4, 4, CV_16UC3, cv::Scalar(0, 65535, 257 * 10));
    ASSERT_TRUE(cv::imwrite(path, deep));

    auto buffer = SourceDecoder().decode(path);
    ASSERT_EQ(buffer.type(), CV_8UC3);
    EXPECT_EQ(buffer.at<cv::Vec3b>(0, 0), cv::Vec3b(10, 255, 0));
}

TEST(SourceDecoder, TransparentPixelsTakeBackground)
{
    TempDir dir;
    auto clear = writeBgra(dir.file("clear.png"), 4, 4, 255, 255, 255, 0);
    auto opaque = writeBgra(dir.file("opaque.png"), 4, 4, 10, 20, 30, 255);

    SourceDecoder decoder(Color { 0, 128, 255 });
    EXPECT_EQ(decoder.decode(clear).at<cv::Vec3b>(2, 2), cv::Vec3b(0, 128, 255));
    EXPECT_EQ(decoder.decode(opaque).at<cv::Vec3b>(2, 2), cv::Vec3b(10, 20, 30));

    decoder.setBackground(Color {});
    EXPECT_EQ(decoder.decode(clear).at<cv::Vec3b>(2, 2), cv::Vec3b(0, 0, 0));
}

TEST(SourceDecoder, HalfAlphaBlends)
{
    cv::Mat bgra(1, 1, CV_8UC4, cv::Scalar(0, 0, 200, 128));
    auto rgb = flattenToCanonical(bgra, Color { 0, 0, 0 });
    auto px = rgb.at<cv::Vec3b>(0, 0);
    EXPECT_NEAR(px[0], 100, 1);
    EXPECT_EQ(px[1], 0);
    EXPECT_EQ(px[2], 0);
}

// ─── Failures ────────────────────────────────────────────────────────────────

TEST(SourceDecoder, GarbageFileIsDecodeError)
{
    TempDir dir;
    auto path = writeGarbage(dir.file("broken.png"));

    SourceDecoder decoder;
    EXPECT_THROW(decoder.probe(path), DecodeError);
    try {
        decoder.decode(path);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.reference(), path);
        EXPECT_FALSE(e.frameIndex().has_value());
    }
}

TEST(SourceDecoder, MissingFileIsDecodeError)
{
    TempDir dir;
    SourceDecoder decoder;
    EXPECT_THROW(decoder.probe(dir.file("absent.png")), DecodeError);
    EXPECT_THROW(decoder.decode(dir.file("absent.png")), DecodeError);
}

TEST(SourceDecoder, UnknownExtensionIsDecodeError)
{
    TempDir dir;
    auto path = writeSolid(dir.file("real.png"), 2, 2, 1, 2, 3);
    auto renamed = dir.file("real.txt");
    std::filesystem::rename(path, renamed);

    EXPECT_THROW(SourceDecoder().probe(renamed), DecodeError);
    EXPECT_THROW(SourceDecoder().decode(renamed), DecodeError);
}

TEST(SourceDecoder, GarbageRawIsDecodeError)
{
    TempDir dir;
    auto path = writeGarbage(dir.file("shot.dng"));

    SourceDecoder decoder;
    EXPECT_THROW(decoder.probe(path), DecodeError);

    Frame frame { path, SourceFormat::RawSensor, nullptr };
    EXPECT_THROW(decoder.decode(frame), DecodeError);
}
