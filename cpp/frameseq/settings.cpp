#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "errors.hpp"

namespace frameseq {

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

}

void validateFps(int fps)
{
    if (fps <= 0) {
        throw InvalidSettingError("fps", std::to_string(fps) + " is not a positive frame rate");
    }
}

void validateLoopCount(int loopCount)
{
    if (loopCount < 0 || loopCount > kMaxLoopCount) {
        throw InvalidSettingError("loop count", std::to_string(loopCount) + " is outside [0, " + std::to_string(kMaxLoopCount) + "]");
    }
}

void validateQuality(int quality)
{
    if (quality < kMinQuality || quality > kMaxQuality) {
        throw InvalidSettingError("quality", std::to_string(quality) + " is outside [1, 100]");
    }
}

void validateResolution(const ResolutionTarget& resolution)
{
    if (!resolution.isOriginal() && resolution.outputHeight() <= 0) {
        throw InvalidSettingError("resolution", "output height must be positive");
    }
}

void validateSettings(const ExportSettings& settings)
{
    validateFps(settings.fps);
    validateLoopCount(settings.loopCount);
    validateQuality(settings.quality);
    validateResolution(settings.resolution);
    if (settings.threads <= 0) {
        throw InvalidSettingError("threads", std::to_string(settings.threads) + " is not a positive thread count");
    }
}

int parseInteger(const std::string& text, const std::string& setting)
{
    size_t consumed = 0;
    int value;
    try {
        value = std::stoi(text, &consumed, 10);
    } catch (const std::invalid_argument&) {
        throw InvalidSettingError(setting, "\"" + text + "\" is not a number");
    } catch (const std::out_of_range&) {
        throw InvalidSettingError(setting, "\"" + text + "\" is too large");
    }
    if (consumed != text.size()) {
        throw InvalidSettingError(setting, "\"" + text + "\" is not a number");
    }
    return value;
}

ResolutionTarget parseResolution(const std::string& text)
{
    auto value = lower(text);
    if (value == "original") {
        return ResolutionTarget::original();
    }

    if (!value.empty() && value.back() == 'p') {
        value.pop_back();
    }

    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidSettingError("resolution", "\"" + text + "\" is not \"original\" or a height");
    }

    auto target = ResolutionTarget::height(parseInteger(value, "resolution"));
    validateResolution(target);
    return target;
}

std::string resolutionName(const ResolutionTarget& resolution)
{
    if (resolution.isOriginal()) {
        return "original";
    }
    return std::to_string(resolution.outputHeight()) + "p";
}

OutputFormat formatFromPath(const std::filesystem::path& path)
{
    auto ext = lower(path.extension().string());
    if (ext == ".gif") {
        return OutputFormat::GIF;
    } else if (ext == ".webp") {
        return OutputFormat::WEBP;
    }

    throw InvalidSettingError("format", "\"" + path.string() + "\" is an unsupported file type for an output image");
}

std::string formatName(OutputFormat format)
{
    switch (format) {
    case OutputFormat::GIF:
        return "gif";
    case OutputFormat::WEBP:
        return "webp";
    }
    return "unknown";
}

int frameDelayMs(int fps)
{
    validateFps(fps);
    return static_cast<int>(std::lround(1000.0 / fps));
}

int frameDelayCs(int fps)
{
    return std::max(1, static_cast<int>(std::lround(frameDelayMs(fps) / 10.0)));
}

int playbackPeriodMs(int fps)
{
    validateFps(fps);
    return std::max(1, 1000 / fps);
}

} // namespace frameseq
