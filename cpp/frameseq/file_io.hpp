#ifndef FRAMESEQ_FILE_IO_HPP
#define FRAMESEQ_FILE_IO_HPP

#include <cstdint>
#include <filesystem>
#include <vector>

namespace frameseq {

// Throws Error when the file cannot be read.
std::vector<uint8_t> readFile(const std::filesystem::path& path);

// Writes to "<path>.part" and renames it over path once every byte is on
// disk. On failure the partial file is removed and Error is thrown; path is
// never left half-written.
void writeFileAtomic(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

std::filesystem::path partialPath(const std::filesystem::path& path);

} // namespace frameseq

#endif
