#ifndef FRAMESEQ_APPS_FRAMESEQ_EXPORT_HPP
#define FRAMESEQ_APPS_FRAMESEQ_EXPORT_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "frameseq/types.hpp"

struct Output {
    frameseq::OutputFormat type;
    std::filesystem::path path;
};

struct Job {
    std::vector<std::string> inputs;
    std::vector<Output> outputs;
    frameseq::ExportSettings settings;
    bool verbose = false;
};

// "#rrggbb" or "rrggbb"
bool ParseColor(const std::string& text, frameseq::Color& color);

#endif
