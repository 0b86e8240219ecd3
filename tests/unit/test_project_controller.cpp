#include <atomic>
#include <filesystem>
#include <gtest/gtest.h>
#include <new>

#include "frameseq/animation_info.hpp"
#include "frameseq/errors.hpp"
#include "frameseq/file_io.hpp"
#include "frameseq/logger.hpp"
#include "frameseq/project_controller.hpp"
#include "util/image_fixtures.hpp"
#include "util/manual_scheduler.hpp"
#include "util/temp_dir.hpp"

using namespace frameseq;
using namespace frameseq::test;
namespace fs = std::filesystem;

namespace {

class FailingWriter : public AnimationWriter {
public:
    explicit FailingWriter(size_t failAt)
        : failAt_(failAt)
    {
    }

    void addFrame(size_t index, const PixelBuffer&, int) override
    {
        if (index == failAt_) {
            throw EncodeError(index, "injected failure");
        }
    }

    std::vector<uint8_t> finish(int) override { return { 1, 2, 3 }; }

private:
    size_t failAt_;
};

class ThrowingWriter : public AnimationWriter {
public:
    void addFrame(size_t, const PixelBuffer&, int) override { throw std::bad_alloc(); }
    std::vector<uint8_t> finish(int) override { return {}; }
};

std::vector<std::string> references(const FrameSequence& frames)
{
    std::vector<std::string> refs;
    for (const auto& frame : frames) {
        refs.push_back(frame.reference);
    }
    return refs;
}

class ProjectControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        paths = writeSequence(dir.path().string(), 3, 32, 24);
        project.setThreads(2);
    }

    TempDir dir;
    ManualScheduler scheduler;
    ProjectController project { scheduler };
    std::vector<std::string> paths;
};

}

// ─── Frame editing ───────────────────────────────────────────────────────────

TEST_F(ProjectControllerTest, AddRemoveUndoRedo)
{
    project.addFrames(paths);
    EXPECT_EQ(references(project.frames()), paths);

    project.removeFrame(1);
    EXPECT_EQ(references(project.frames()), (std::vector<std::string> { paths[0], paths[2] }));

    EXPECT_EQ(project.undo(), HistoryResult::Applied);
    EXPECT_EQ(references(project.frames()), paths);

    EXPECT_EQ(project.redo(), HistoryResult::Applied);
    EXPECT_EQ(references(project.frames()), (std::vector<std::string> { paths[0], paths[2] }));

    EXPECT_EQ(project.redo(), HistoryResult::Underflow);
}

TEST_F(ProjectControllerTest, AddIsAtomic)
{
    project.addFrames({ paths[0] });
    auto bad = writeGarbage(dir.file("bad.png"));

    EXPECT_THROW(project.addFrames({ paths[1], bad, paths[2] }), DecodeError);
    EXPECT_EQ(references(project.frames()), (std::vector<std::string> { paths[0] }));

    // The failed add left no history entry behind.
    EXPECT_EQ(project.undo(), HistoryResult::Applied);
    EXPECT_EQ(project.frameCount(), 0u);
    EXPECT_FALSE(project.canUndo());
}

TEST_F(ProjectControllerTest, MoveFrameIsUndoable)
{
    project.addFrames(paths);
    project.moveFrame(0, 2);
    EXPECT_EQ(references(project.frames()), (std::vector<std::string> { paths[1], paths[2], paths[0] }));
    EXPECT_EQ(project.currentIndex(), 2u);

    project.undo();
    EXPECT_EQ(references(project.frames()), paths);

    EXPECT_THROW(project.moveFrame(0, 3), IndexError);
}

TEST_F(ProjectControllerTest, RemoveOutOfRangeThrows)
{
    project.addFrames(paths);
    EXPECT_THROW(project.removeFrame(3), IndexError);
    EXPECT_EQ(project.frameCount(), 3u);
}

TEST_F(ProjectControllerTest, SelectionFollowsEdits)
{
    project.addFrames({ paths[0] });
    EXPECT_EQ(project.currentIndex(), 0u);

    project.addFrames({ paths[1], paths[2] });
    EXPECT_EQ(project.currentIndex(), 1u);

    project.select(2);
    project.removeFrame(2);
    EXPECT_EQ(project.currentIndex(), 1u);

    project.undo();
    EXPECT_EQ(project.currentIndex(), 0u);
    EXPECT_THROW(project.select(5), IndexError);
}

TEST_F(ProjectControllerTest, ChangeEventsAfterMutations)
{
    std::vector<std::pair<size_t, size_t>> events;
    project.setFramesChangedCallback([&](size_t first, size_t last) { events.emplace_back(first, last); });

    project.addFrames(paths);
    project.removeFrame(0);
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], std::make_pair<size_t, size_t>(0, 3));
}

TEST_F(ProjectControllerTest, CloseDropsEverything)
{
    project.addFrames(paths);
    project.playback().play();
    project.close();

    EXPECT_EQ(project.frameCount(), 0u);
    EXPECT_FALSE(project.canUndo());
    EXPECT_FALSE(project.playback().playing());
}

// ─── Settings ────────────────────────────────────────────────────────────────

TEST_F(ProjectControllerTest, SettersValidate)
{
    EXPECT_THROW(project.setQuality(0), InvalidSettingError);
    EXPECT_THROW(project.setQuality(101), InvalidSettingError);
    EXPECT_THROW(project.setFps(0), InvalidSettingError);
    EXPECT_THROW(project.setLoopCount(-1), InvalidSettingError);
    EXPECT_THROW(project.setResolution(ResolutionTarget::height(-10)), InvalidSettingError);
    EXPECT_THROW(project.setResolution(ResolutionTarget::height(0)), InvalidSettingError);
    EXPECT_TRUE(project.settings().resolution.isOriginal());
    EXPECT_THROW(project.setThreads(0), InvalidSettingError);
    EXPECT_EQ(project.settings().quality, 85);

    project.setFps(12);
    EXPECT_EQ(project.settings().fps, 12);
    EXPECT_EQ(project.playback().fps(), 12);
}

// ─── Preview ─────────────────────────────────────────────────────────────────

TEST_F(ProjectControllerTest, PreviewFitsBox)
{
    project.addFrames(paths);
    auto preview = project.previewFrame(0, { 16, 16 });
    EXPECT_EQ(preview.size(), cv::Size(16, 12));
    EXPECT_NE(project.frames()[0].canonical, nullptr);

    EXPECT_THROW(project.previewFrame(3, { 16, 16 }), IndexError);
}

// ─── Export ──────────────────────────────────────────────────────────────────

TEST_F(ProjectControllerTest, ExportEmptyProject)
{
    auto dest = dir.file("out.gif");
    auto result = project.exportTo(dest);

    EXPECT_EQ(result.status, ExportStatus::EmptyProject);
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_FALSE(fs::exists(partialPath(dest)));
}

TEST_F(ProjectControllerTest, ExportGif)
{
    project.addFrames(paths);
    project.setFps(10);
    project.setLoopCount(3);

    double lastOverall = 0.0;
    bool monotonic = true;
    auto dest = dir.file("out.gif");
    auto result = project.exportTo(dest, [&](const ExportProgress& p) {
        if (p.overall() < lastOverall) {
            monotonic = false;
        }
        lastOverall = p.overall();
    });

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_TRUE(monotonic);
    EXPECT_DOUBLE_EQ(lastOverall, 1.0);
    EXPECT_FALSE(fs::exists(partialPath(dest)));

    auto info = inspectAnimationFile(dest);
    EXPECT_EQ(info.format, OutputFormat::GIF);
    EXPECT_EQ(info.frameCount, 3u);
    EXPECT_EQ(info.width, 32);
    EXPECT_EQ(info.height, 24);
    EXPECT_EQ(info.loopCount, std::optional<int>(3));
    EXPECT_EQ(result.bytesWritten, fs::file_size(dest));
}

TEST_F(ProjectControllerTest, ExportWebPAtHeight)
{
    project.addFrames(paths);
    project.setFormat(OutputFormat::WEBP);
    project.setResolution(ResolutionTarget::height(12));

    auto dest = dir.file("out.webp");
    auto result = project.exportTo(dest);
    ASSERT_TRUE(result.ok()) << result.message;

    auto info = inspectAnimationFile(dest);
    EXPECT_EQ(info.format, OutputFormat::WEBP);
    EXPECT_EQ(info.frameCount, 3u);
    EXPECT_EQ(info.width, 16);
    EXPECT_EQ(info.height, 12);
    EXPECT_EQ(info.delaysMs, (std::vector<int> { 42, 42, 42 }));
}

TEST_F(ProjectControllerTest, CorruptFrameFailsWithIndex)
{
    project.addFrames(paths);
    writeGarbage(paths[1]);

    auto dest = dir.file("out.gif");
    auto result = project.exportTo(dest);

    EXPECT_EQ(result.status, ExportStatus::DecodeFailed);
    ASSERT_TRUE(result.frameIndex.has_value());
    EXPECT_EQ(*result.frameIndex, 1u);
    EXPECT_EQ(result.reference, paths[1]);
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_FALSE(fs::exists(partialPath(dest)));
    EXPECT_FALSE(project.exporting());
}

TEST_F(ProjectControllerTest, EncoderFailureFailsWithIndex)
{
    ProjectController failing(scheduler, Encoder([](cv::Size, const EncodeOptions&) {
        return std::unique_ptr<AnimationWriter>(new FailingWriter(1));
    }));
    failing.addFrames(paths);

    auto dest = dir.file("out.gif");
    auto result = failing.exportTo(dest);

    EXPECT_EQ(result.status, ExportStatus::EncodeFailed);
    EXPECT_EQ(result.frameIndex, std::optional<size_t>(1));
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(ProjectControllerTest, CancelDuringExport)
{
    project.addFrames(paths);

    auto dest = dir.file("out.gif");
    auto result = project.exportTo(dest, [&](const ExportProgress&) { project.cancelExport(); });

    EXPECT_EQ(result.status, ExportStatus::Cancelled);
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_FALSE(fs::exists(partialPath(dest)));
}

TEST_F(ProjectControllerTest, MutationsRejectedWhileExporting)
{
    project.addFrames(paths);

    std::atomic<bool> rejected { false };
    ExportStatus nested = ExportStatus::Ok;
    bool checked = false;
    auto dest = dir.file("out.webp");
    project.setFormat(OutputFormat::WEBP);
    auto result = project.exportTo(dest, [&](const ExportProgress& p) {
        if (checked || p.stage != ExportProgress::Stage::Encode) {
            return;
        }
        checked = true;
        try {
            project.removeFrame(0);
        } catch (const ExportInProgressError&) {
            rejected = true;
        }
        nested = project.exportTo(dir.file("other.webp")).status;
    });

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_TRUE(rejected);
    EXPECT_EQ(nested, ExportStatus::Busy);
    EXPECT_EQ(project.frameCount(), 3u);
    EXPECT_FALSE(fs::exists(dir.file("other.webp")));

    // Idle again afterwards.
    EXPECT_NO_THROW(project.removeFrame(0));
}

TEST_F(ProjectControllerTest, ExportKeepsDecodedBuffers)
{
    project.addFrames(paths);
    ASSERT_TRUE(project.exportTo(dir.file("out.gif")).ok());
    for (const auto& frame : project.frames()) {
        EXPECT_NE(frame.canonical, nullptr);
    }
}

TEST_F(ProjectControllerTest, UnexpectedWriterExceptionIsEncodeFailure)
{
    ProjectController failing(scheduler, Encoder([](cv::Size, const EncodeOptions&) {
        return std::unique_ptr<AnimationWriter>(new ThrowingWriter());
    }));
    failing.addFrames(paths);

    auto dest = dir.file("out.gif");
    auto result = failing.exportTo(dest);

    EXPECT_EQ(result.status, ExportStatus::EncodeFailed);
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_FALSE(fs::exists(partialPath(dest)));
    EXPECT_FALSE(failing.exporting());
}

// ─── Background changes ──────────────────────────────────────────────────────

TEST_F(ProjectControllerTest, BackgroundChangeReachesUndoneFrames)
{
    auto clear = writeBgra(dir.file("clear.png"), 16, 16, 0, 0, 0, 0);
    project.setFormat(OutputFormat::WEBP);
    project.setQuality(100);

    project.addFrames({ clear });
    ASSERT_TRUE(project.exportTo(dir.file("black.webp")).ok());
    ASSERT_NE(project.frames()[0].canonical, nullptr);

    project.addFrames({ paths[0] });
    project.setBackground(Color { 255, 255, 255 });
    ASSERT_EQ(project.undo(), HistoryResult::Applied);
    EXPECT_EQ(project.frames()[0].canonical, nullptr);

    auto dest = dir.file("white.webp");
    auto result = project.exportTo(dest);
    ASSERT_TRUE(result.ok()) << result.message;

    auto frames = decodeWebPFrames(readFile(dest));
    ASSERT_EQ(frames.size(), 1u);
    auto px = frames[0].at<cv::Vec3b>(8, 8);
    EXPECT_GT(px[0], 240);
    EXPECT_GT(px[1], 240);
    EXPECT_GT(px[2], 240);
}

TEST_F(ProjectControllerTest, PreviewFollowsBackground)
{
    auto clear = writeBgra(dir.file("clear.png"), 8, 8, 0, 0, 0, 0);
    project.addFrames({ clear });

    EXPECT_EQ(project.previewFrame(0, { 8, 8 }).at<cv::Vec3b>(4, 4), cv::Vec3b(0, 0, 0));

    project.setBackground(Color { 255, 0, 0 });
    EXPECT_EQ(project.previewFrame(0, { 8, 8 }).at<cv::Vec3b>(4, 4), cv::Vec3b(255, 0, 0));
}

// ─── Logging ─────────────────────────────────────────────────────────────────

TEST_F(ProjectControllerTest, RejectedCallsAreLoggedOnce)
{
    std::vector<std::string> errors;
    auto& logger = Logger::instance();
    logger.clearSinks();
    logger.addSink(sinks::callbackSink([&errors](LogLevel level, const std::string& category, const std::string& message) {
        if (level == LogLevel::Error && category == "controller") {
            errors.push_back(message);
        }
    }));

    project.addFrames(paths);
    EXPECT_THROW(project.removeFrame(7), IndexError);
    EXPECT_THROW(project.setQuality(0), InvalidSettingError);
    EXPECT_THROW(project.select(9), IndexError);

    logger.clearSinks();
    logger.addSink(sinks::consoleSink());

    ASSERT_EQ(errors.size(), 3u);
    EXPECT_NE(errors[0].find("remove frame"), std::string::npos);
    EXPECT_NE(errors[1].find("quality"), std::string::npos);
    EXPECT_NE(errors[2].find("select"), std::string::npos);
}
