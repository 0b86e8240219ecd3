#ifndef FRAMESEQ_LOGGER_HPP
#define FRAMESEQ_LOGGER_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace frameseq {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
};

class Logger {
public:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string category;
        std::string message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool isEnabled(LogLevel level) const;

    void addSink(LogSink sink);
    void clearSinks();

    void log(LogLevel level, const std::string& category, const std::string& message);

    // Replaces each "{}" in order with the streamed value of the next argument.
    template <typename... Args>
    void logFormatted(LogLevel level, const std::string& category, const std::string& format, Args&&... args)
    {
        if (!isEnabled(level)) {
            return;
        }
        std::string message(format);
        size_t pos = 0;
        (replaceNext(message, pos, std::forward<Args>(args)), ...);
        log(level, category, message);
    }

    static std::string levelName(LogLevel level);
    static std::string timestampString(const std::chrono::system_clock::time_point& tp);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static void replaceNext(std::string& message, size_t& pos, T&& value)
    {
        pos = message.find("{}", pos);
        if (pos == std::string::npos) {
            return;
        }
        std::ostringstream ss;
        ss << std::forward<T>(value);
        auto text = ss.str();
        message.replace(pos, 2, text);
        pos += text.size();
    }

    mutable std::mutex mutex_;
    LogLevel minLevel_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks {
    // Writes "timestamp LEVEL [category] message" lines to std::cerr.
    Logger::LogSink consoleSink();
    Logger::LogSink nullSink();
    Logger::LogSink callbackSink(std::function<void(LogLevel, const std::string&, const std::string&)> callback);
}

} // namespace frameseq

#define FRAMESEQ_LOG(lvl, category, ...)                                                     \
    do {                                                                                     \
        if (::frameseq::Logger::instance().isEnabled(lvl)) {                                 \
            ::frameseq::Logger::instance().logFormatted(lvl, category, __VA_ARGS__);         \
        }                                                                                    \
    } while (0)

#define FRAMESEQ_LOG_TRACE(category, ...) FRAMESEQ_LOG(::frameseq::LogLevel::Trace, category, __VA_ARGS__)
#define FRAMESEQ_LOG_DEBUG(category, ...) FRAMESEQ_LOG(::frameseq::LogLevel::Debug, category, __VA_ARGS__)
#define FRAMESEQ_LOG_INFO(category, ...) FRAMESEQ_LOG(::frameseq::LogLevel::Info, category, __VA_ARGS__)
#define FRAMESEQ_LOG_WARN(category, ...) FRAMESEQ_LOG(::frameseq::LogLevel::Warning, category, __VA_ARGS__)
#define FRAMESEQ_LOG_ERROR(category, ...) FRAMESEQ_LOG(::frameseq::LogLevel::Error, category, __VA_ARGS__)
#define FRAMESEQ_LOG_CRITICAL(category, ...) FRAMESEQ_LOG(::frameseq::LogLevel::Critical, category, __VA_ARGS__)

#endif
