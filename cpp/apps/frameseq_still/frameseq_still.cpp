#include <filesystem>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

#include "frameseq/errors.hpp"
#include "frameseq/resampler.hpp"
#include "frameseq/settings.hpp"
#include "frameseq/source_decoder.hpp"

#define NEXTARG()                                                     \
    if (((argIndex + 1) == argc) || (argv[argIndex + 1][0] == '-')) { \
        std::cerr << arg << " requires an argument." << std::endl;    \
        return EXIT_FAILURE;                                          \
    }                                                                 \
    arg = std::string(argv[++argIndex])

void syntax()
{
    std::cerr << "Syntax: frameseq_still [options] -i input.dng -r 720p -o out.png"
              << std::endl
              << "Options:" << std::endl
              << "  -h,--help                   : Shows syntax help" << std::endl
              << "  -i,--input FILENAME         : Input file location (supported "
                 "types are png, jpg, jpeg, bmp, gif and dng)."
              << std::endl
              << "  -r,--resolution RES         : original, a preset like 720p, or a height"
              << std::endl
              << "  --optimize                  : Cap the longer edge at 800px" << std::endl
              << "  -o,--output FILENAME        : Output filename"
                 " (supported types are png)."
              << std::endl
              << std::endl;
}

int main(int argc, char* argv[])
{
    std::string input;
    std::string output;
    auto resolution = frameseq::ResolutionTarget::original();
    bool optimize = false;

    int argIndex = 1;
    while (argIndex < argc) {
        std::string arg = argv[argIndex];

        if (arg == "--help" || arg == "-h") {
            syntax();
            return EXIT_FAILURE;
        } else if (arg == "--output" || arg == "-o") {
            NEXTARG();
            if (std::filesystem::path(arg).extension() != ".png") {
                std::cerr << "\"" << arg
                          << "\" is an unsupported file type for an output image."
                          << std::endl;
                return EXIT_FAILURE;
            }
            output = arg;
        } else if (arg == "--input" || arg == "-i") {
            NEXTARG();
            if (!frameseq::classifySource(arg)) {
                std::cerr << "\"" << arg
                          << "\" is an unsupported file type for an input image."
                          << std::endl;
                return EXIT_FAILURE;
            }
            input = arg;
        } else if (arg == "--resolution" || arg == "-r") {
            NEXTARG();
            try {
                resolution = frameseq::parseResolution(arg);
            } catch (const frameseq::InvalidSettingError& e) {
                std::cerr << e.what() << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--optimize") {
            optimize = true;
        } else {
            std::cerr << "\"" << arg << "\" is an unknown argument." << std::endl;
            return EXIT_FAILURE;
        }

        argIndex++;
    }

    if (!input.size() || !output.size()) {
        syntax();
        return EXIT_FAILURE;
    }

    frameseq::SourceDecoder decoder;
    frameseq::PixelBuffer img;
    try {
        auto canonical = decoder.decode(input);
        img = frameseq::resample(canonical, resolution, optimize);
    } catch (const frameseq::Error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    cv::Mat bgr;
    cv::cvtColor(img, bgr, cv::COLOR_RGB2BGR);
    if (!cv::imwrite(output, bgr)) {
        std::cerr << "\"" << output << "\" failed to write output image." << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << output << " " << img.cols << "x" << img.rows << std::endl;
    return EXIT_SUCCESS;
}
