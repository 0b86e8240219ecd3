#include "file_io.hpp"

#include <cstdio>
#include <fstream>
#include <memory>

#include "errors.hpp"
#include "logger.hpp"

namespace frameseq {

std::vector<uint8_t> readFile(const std::filesystem::path& path)
{
    std::unique_ptr<std::FILE, int (*)(std::FILE*)> in(std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!in) {
        throw Error("\"" + path.string() + "\" failed to read input file.");
    }

    std::fseek(in.get(), 0, SEEK_END);
    auto fileSize = std::ftell(in.get());
    std::fseek(in.get(), 0, SEEK_SET);
    if (fileSize < 0) {
        throw Error("\"" + path.string() + "\" failed to read input file.");
    }

    std::vector<uint8_t> data(static_cast<size_t>(fileSize));
    if (!data.empty() && std::fread(data.data(), data.size(), 1, in.get()) != 1) {
        throw Error("\"" + path.string() + "\" failed to read input file.");
    }
    return data;
}

std::filesystem::path partialPath(const std::filesystem::path& path)
{
    auto partial = path;
    partial += ".part";
    return partial;
}

void writeFileAtomic(const std::filesystem::path& path, const std::vector<uint8_t>& bytes)
{
    auto partial = partialPath(path);

    std::ofstream fout;
    fout.open(partial, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!fout) {
        throw Error("\"" + partial.string() + "\" could not be opened for writing.");
    }
    fout.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    fout.close();

    std::error_code ec;
    if (!fout) {
        std::filesystem::remove(partial, ec);
        throw Error("\"" + partial.string() + "\" write failed.");
    }

    std::filesystem::rename(partial, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        throw Error("\"" + path.string() + "\" could not be finalized: " + ec.message());
    }

    FRAMESEQ_LOG_DEBUG("export", "wrote {} bytes to \"{}\"", bytes.size(), path.string());
}

} // namespace frameseq
