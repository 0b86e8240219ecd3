#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "frameseq/errors.hpp"
#include "frameseq/logger.hpp"
#include "frameseq/project_controller.hpp"
#include "frameseq/scheduler.hpp"
#include "frameseq/settings.hpp"

#include "frameseq_export.hpp"

#define NEXTARG()                                                     \
    if (((argIndex + 1) == argc) || (argv[argIndex + 1][0] == '-')) { \
        std::cerr << arg << " requires an argument." << std::endl;    \
        return EXIT_FAILURE;                                          \
    }                                                                 \
    arg = std::string(argv[++argIndex])

namespace {

std::atomic<frameseq::ProjectController*> activeProject { nullptr };

void onInterrupt(int)
{
    auto project = activeProject.load();
    if (project) {
        project->cancelExport();
    }
}

}

void syntax()
{
    std::cerr << "Syntax: frameseq_export [options] -i frame1.png -i frame2.jpg -i frame3.dng -o "
                 "output.gif -o output.webp"
              << std::endl
              << "Options:" << std::endl
              << "  -h,--help                   : Shows syntax help" << std::endl
              << "  -i,--input FILENAME         : Input frame, in order (supported "
                 "types are png, jpg, jpeg, bmp, gif and dng)."
              << std::endl
              << "  -o,--output FILENAME        : Output file location "
                 " (supported types are gif, webp)."
              << std::endl
              << "  -f,--fps FPS                : Frames per second. (default 24)" << std::endl
              << "  -l,--loop COUNT             : Loop count, 0 loops forever. (default 0)" << std::endl
              << "  -r,--resolution RES         : original, 1080p, 720p, 480p, 360p or an "
                 "output height. (default original)"
              << std::endl
              << "  --optimize / --no-optimize  : Cap frames at 800px and compress harder. "
                 "(default on)"
              << std::endl
              << "  -q,--quality Q              : Quality 1-100. (default 85)" << std::endl
              << "  -t,--threads THREADS        : The number of threads to use." << std::endl
              << "  -b,--background RRGGBB      : Colour transparent pixels are flattened onto. "
                 "(default 000000)"
              << std::endl
              << "  -v,--verbose                : Debug logging." << std::endl
              << std::endl;
}

bool ParseColor(const std::string& text, frameseq::Color& color)
{
    auto hex = text;
    if (!hex.empty() && hex[0] == '#') {
        hex = hex.substr(1);
    }
    if (hex.size() != 6 || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        return false;
    }

    auto value = std::stoul(hex, nullptr, 16);
    color.r = static_cast<uint8_t>((value >> 16) & 0xff);
    color.g = static_cast<uint8_t>((value >> 8) & 0xff);
    color.b = static_cast<uint8_t>(value & 0xff);
    return true;
}

bool ParseInt(const std::string& text, const std::string& setting, int& value)
{
    try {
        value = frameseq::parseInteger(text, setting);
    } catch (const frameseq::InvalidSettingError&) {
        return false;
    }
    return true;
}

int main(int argc, char* argv[])
{
    Job job;

    int argIndex = 1;
    while (argIndex < argc) {
        std::string arg = argv[argIndex];

        if (arg == "--fps" || arg == "-f") {
            NEXTARG();
            if (!ParseInt(arg, "fps", job.settings.fps) || job.settings.fps <= 0) {
                std::cerr << "\"" << arg << "\" is not a valid value for fps."
                          << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--loop" || arg == "-l") {
            NEXTARG();
            if (!ParseInt(arg, "loop", job.settings.loopCount) || job.settings.loopCount < 0
                || job.settings.loopCount > frameseq::kMaxLoopCount) {
                std::cerr << "\"" << arg << "\" is not a valid value for loop."
                          << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--resolution" || arg == "-r") {
            NEXTARG();
            try {
                job.settings.resolution = frameseq::parseResolution(arg);
            } catch (const frameseq::InvalidSettingError& e) {
                std::cerr << e.what() << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--optimize") {
            job.settings.optimize = true;
        } else if (arg == "--no-optimize") {
            job.settings.optimize = false;
        } else if (arg == "--quality" || arg == "-q") {
            NEXTARG();
            if (!ParseInt(arg, "quality", job.settings.quality) || job.settings.quality < frameseq::kMinQuality
                || job.settings.quality > frameseq::kMaxQuality) {
                std::cerr << "\"" << arg << "\" is not a valid value for quality."
                          << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--threads" || arg == "-t") {
            NEXTARG();
            if (!ParseInt(arg, "threads", job.settings.threads) || job.settings.threads <= 0) {
                std::cerr << "\"" << arg << "\" is not a valid value for threads."
                          << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--background" || arg == "-b") {
            NEXTARG();
            if (!ParseColor(arg, job.settings.background)) {
                std::cerr << "\"" << arg << "\" is not a valid colour."
                          << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            job.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            syntax();
            return EXIT_FAILURE;
        } else if (arg == "--output" || arg == "-o") {
            NEXTARG();
            Output output;
            output.path = arg;
            try {
                output.type = frameseq::formatFromPath(output.path);
            } catch (const frameseq::InvalidSettingError&) {
                std::cerr << "\"" << arg
                          << "\" is an unsupported file type for an output image."
                          << std::endl;
                return EXIT_FAILURE;
            }

            job.outputs.push_back(output);
        } else if (arg == "--input" || arg == "-i") {
            NEXTARG();
            job.inputs.push_back(arg);
        } else {
            std::cerr << "\"" << arg << "\" is an unknown argument." << std::endl;
            return EXIT_FAILURE;
        }

        argIndex++;
    }

    if (job.inputs.size() == 0) {
        std::cerr << "0 input files provided, at least 1 input file is required."
                  << std::endl;
        return EXIT_FAILURE;
    }

    if (job.outputs.size() == 0) {
        std::cerr << "0 output files provided, at least 1 output file is required."
                  << std::endl;
        return EXIT_FAILURE;
    }

    if (job.verbose) {
        frameseq::Logger::instance().setLevel(frameseq::LogLevel::Debug);
    }

    frameseq::ThreadScheduler scheduler;
    frameseq::ProjectController project(scheduler);

    try {
        project.setFps(job.settings.fps);
        project.setLoopCount(job.settings.loopCount);
        project.setResolution(job.settings.resolution);
        project.setOptimize(job.settings.optimize);
        project.setQuality(job.settings.quality);
        project.setThreads(job.settings.threads);
        project.setBackground(job.settings.background);
        project.addFrames(job.inputs);
    } catch (const frameseq::Error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    activeProject = &project;
    std::signal(SIGINT, onInterrupt);

    auto status = EXIT_SUCCESS;
    for (const auto& output : job.outputs) {
        project.setFormat(output.type);

        auto result = project.exportTo(output.path, [&output](const frameseq::ExportProgress& progress) {
            std::cerr << "\r" << output.path.filename().string() << ": "
                      << std::setw(3) << static_cast<int>(progress.overall() * 100) << "%" << std::flush;
        });
        std::cerr << std::endl;

        if (!result.ok()) {
            std::cerr << "\"" << output.path.string() << "\" " << frameseq::exportStatusName(result.status)
                      << ": " << result.message << std::endl;
            status = EXIT_FAILURE;
            if (result.status == frameseq::ExportStatus::Cancelled) {
                break;
            }
            continue;
        }

        std::cout << output.path.string() << " " << result.bytesWritten << std::endl;
    }

    std::signal(SIGINT, SIG_DFL);
    activeProject = nullptr;

    return status;
}
