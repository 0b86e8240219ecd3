#ifndef FRAMESEQ_SETTINGS_HPP
#define FRAMESEQ_SETTINGS_HPP

#include <filesystem>
#include <string>

#include "types.hpp"

namespace frameseq {

// Throws InvalidSettingError naming the first out-of-range field.
void validateSettings(const ExportSettings& settings);

void validateFps(int fps);
void validateLoopCount(int loopCount);
void validateQuality(int quality);
void validateResolution(const ResolutionTarget& resolution);

// Decimal integer, optionally signed. Throws InvalidSettingError naming
// setting when text is not a number or does not fit in an int.
int parseInteger(const std::string& text, const std::string& setting);

// Accepts "original", the presets 1080p/720p/480p/360p, or a positive height.
ResolutionTarget parseResolution(const std::string& text);
std::string resolutionName(const ResolutionTarget& resolution);

// ".gif" or ".webp", case-insensitive; anything else is InvalidSettingError.
OutputFormat formatFromPath(const std::filesystem::path& path);
std::string formatName(OutputFormat format);

// round(1000 / fps)
int frameDelayMs(int fps);

// GIF stores delays in hundredths of a second.
int frameDelayCs(int fps);

// Preview timer period, 1000 / fps truncated.
int playbackPeriodMs(int fps);

} // namespace frameseq

#endif
