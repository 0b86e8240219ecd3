#include "logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace frameseq {

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

Logger::Logger()
{
    sinks_.push_back(sinks::consoleSink());
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

bool Logger::isEnabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= minLevel_;
}

void Logger::addSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clearSinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, const std::string& category, const std::string& message)
{
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = category;
    entry.message = message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minLevel_) {
        return;
    }
    for (const auto& sink : sinks_) {
        sink(entry);
    }
}

std::string Logger::levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string Logger::timestampString(const std::chrono::system_clock::time_point& tp)
{
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local {};
    localtime_r(&time, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

namespace sinks {

    Logger::LogSink consoleSink()
    {
        return [](const Logger::LogEntry& entry) {
            std::cerr << Logger::timestampString(entry.timestamp) << " "
                      << Logger::levelName(entry.level) << " "
                      << "[" << entry.category << "] " << entry.message << std::endl;
        };
    }

    Logger::LogSink nullSink()
    {
        return [](const Logger::LogEntry&) {};
    }

    Logger::LogSink callbackSink(std::function<void(LogLevel, const std::string&, const std::string&)> callback)
    {
        return [callback = std::move(callback)](const Logger::LogEntry& entry) {
            callback(entry.level, entry.category, entry.message);
        };
    }

}

} // namespace frameseq
