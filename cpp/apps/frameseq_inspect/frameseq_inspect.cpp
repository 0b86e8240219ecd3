#include <cstdio>
#include <filesystem>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

#include "frameseq/animation_info.hpp"
#include "frameseq/errors.hpp"
#include "frameseq/file_io.hpp"
#include "frameseq/settings.hpp"

#define NEXTARG()                                                     \
    if (((argIndex + 1) == argc) || (argv[argIndex + 1][0] == '-')) { \
        std::cerr << arg << " requires an argument." << std::endl;    \
        return EXIT_FAILURE;                                          \
    }                                                                 \
    arg = std::string(argv[++argIndex])

void syntax()
{
    std::cerr << "Syntax: frameseq_inspect -i input.webp [-o output]"
              << std::endl
              << "Options:" << std::endl
              << "  -h,--help                   : Shows syntax help" << std::endl
              << "  -i,--input FILENAME         : Input file location (supported "
                 "types are gif and webp)."
              << std::endl
              << "  -o,--output FOLDER          : Dump frames as PNG into this folder "
                 "(webp only)."
              << std::endl
              << std::endl;
}

int main(int argc, char* argv[])
{
    std::string input;
    std::string output;

    int argIndex = 1;
    while (argIndex < argc) {
        std::string arg = argv[argIndex];

        if (arg == "--help" || arg == "-h") {
            syntax();
            return EXIT_FAILURE;
        } else if (arg == "--output" || arg == "-o") {
            NEXTARG();

            output = arg;
        } else if (arg == "--input" || arg == "-i") {
            NEXTARG();
            try {
                frameseq::formatFromPath(arg);
            } catch (const frameseq::InvalidSettingError&) {
                std::cerr << "\"" << arg
                          << "\" is an unsupported file type for an input image. (supported types are gif and webp)"
                          << std::endl;
                return EXIT_FAILURE;
            }

            input = arg;
        } else {
            std::cerr << "\"" << arg << "\" is an unknown argument." << std::endl;
            return EXIT_FAILURE;
        }

        argIndex++;
    }

    if (!input.size()) {
        syntax();
        return EXIT_FAILURE;
    }

    std::vector<uint8_t> data;
    frameseq::AnimationInfo info;
    try {
        data = frameseq::readFile(input);
        info = frameseq::inspectAnimation(data);
    } catch (const frameseq::Error& e) {
        std::cerr << "\"" << input << "\" " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "format: " << frameseq::formatName(info.format)
              << " frame_count: " << info.frameCount
              << " width: " << info.width
              << " height: " << info.height
              << " loop: " << (info.loopCount ? std::to_string(*info.loopCount) : std::string("none"))
              << std::endl;
    std::cout << "idx,delay_ms" << std::endl;
    for (size_t i = 0; i < info.delaysMs.size(); i++) {
        std::cout << i << "," << info.delaysMs[i] << std::endl;
    }

    if (!output.size()) {
        return EXIT_SUCCESS;
    }

    if (info.format != frameseq::OutputFormat::WEBP) {
        std::cerr << "\"" << input << "\" frame dump is only supported for webp." << std::endl;
        return EXIT_FAILURE;
    }

    std::vector<frameseq::PixelBuffer> frames;
    try {
        frames = frameseq::decodeWebPFrames(data);
    } catch (const frameseq::Error& e) {
        std::cerr << "\"" << input << "\" " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    char buffer[16];
    for (size_t frameIndex = 0; frameIndex < frames.size(); frameIndex++) {
        std::snprintf(buffer, sizeof(buffer), "%04zu.png", frameIndex);
        auto filename = std::filesystem::path(output) / buffer;

        cv::Mat bgr;
        cv::cvtColor(frames[frameIndex], bgr, cv::COLOR_RGB2BGR);
        if (!cv::imwrite(filename.string(), bgr)) {
            std::cerr << "\"" << filename.string() << "\" failed to write frame #" << frameIndex << std::endl;
            return EXIT_FAILURE;
        }
    }

    return EXIT_SUCCESS;
}
