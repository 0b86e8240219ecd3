#ifndef FRAMESEQ_ERRORS_HPP
#define FRAMESEQ_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace frameseq {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DecodeError : public Error {
public:
    DecodeError(std::string reference, std::string cause)
        : Error("failed to decode \"" + reference + "\": " + cause)
        , reference_(std::move(reference))
        , cause_(std::move(cause))
    {
    }

    const std::string& reference() const { return reference_; }
    const std::string& cause() const { return cause_; }

    // Position in the exported sequence, when raised during an export.
    std::optional<size_t> frameIndex() const { return frameIndex_; }
    void setFrameIndex(size_t index) { frameIndex_ = index; }

private:
    std::string reference_;
    std::string cause_;
    std::optional<size_t> frameIndex_;
};

class ResizeError : public Error {
public:
    ResizeError(int width, int height)
        : Error("degenerate output size " + std::to_string(width) + "x" + std::to_string(height))
        , width_(width)
        , height_(height)
    {
    }

    int width() const { return width_; }
    int height() const { return height_; }

    std::optional<size_t> frameIndex() const { return frameIndex_; }
    void setFrameIndex(size_t index) { frameIndex_ = index; }

private:
    int width_;
    int height_;
    std::optional<size_t> frameIndex_;
};

class EncodeError : public Error {
public:
    EncodeError(size_t frameIndex, std::string cause)
        : Error("failed to encode frame #" + std::to_string(frameIndex) + ": " + cause)
        , frameIndex_(frameIndex)
        , cause_(std::move(cause))
    {
    }

    size_t frameIndex() const { return frameIndex_; }
    const std::string& cause() const { return cause_; }

private:
    size_t frameIndex_;
    std::string cause_;
};

class IndexError : public Error {
public:
    IndexError(size_t index, size_t size)
        : Error("frame index " + std::to_string(index) + " out of range (" + std::to_string(size) + " frames)")
        , index_(index)
        , size_(size)
    {
    }

    size_t index() const { return index_; }
    size_t size() const { return size_; }

private:
    size_t index_;
    size_t size_;
};

class EmptyProjectError : public Error {
public:
    EmptyProjectError()
        : Error("project has no frames")
    {
    }
};

class CancelledError : public Error {
public:
    CancelledError()
        : Error("export cancelled")
    {
    }
};

class InvalidSettingError : public Error {
public:
    InvalidSettingError(std::string setting, const std::string& detail)
        : Error("invalid " + setting + ": " + detail)
        , setting_(std::move(setting))
    {
    }

    const std::string& setting() const { return setting_; }

private:
    std::string setting_;
};

class ExportInProgressError : public Error {
public:
    ExportInProgressError()
        : Error("an export is in progress")
    {
    }
};

} // namespace frameseq

#endif
