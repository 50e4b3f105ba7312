#ifndef SOLO_LOGGER_HPP
#define SOLO_LOGGER_HPP

#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <functional>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <vector>
#include <nlohmann/json.hpp>

namespace solo {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    EVENT
};

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();

    void init(const std::filesystem::path& logPath, bool verbose);
    void log(LogLevel level, const std::string& message);

    // Structured decision record: "<name> <compact json>"
    void event(const std::string& name, const nlohmann::json& fields);

    // Extra sinks receive the unformatted message. Returns an id for removeSink.
    int addSink(Sink sink);
    void removeSink(int id);

    void setVerbose(bool verbose);
    std::filesystem::path path() const { return logPath_; }

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    std::filesystem::path logPath_;
    bool verbose_ = false;
    std::mutex mutex_;

    int nextSinkId_ = 1;
    std::vector<std::pair<int, Sink>> sinks_;

    std::string getTimestamp();
    std::string getLevelString(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) solo::Logger::instance().log(solo::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) solo::Logger::instance().log(solo::LogLevel::INFO, msg)
#define LOG_WARN(msg) solo::Logger::instance().log(solo::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) solo::Logger::instance().log(solo::LogLevel::ERROR, msg)
#define LOG_EVENT(name, fields) solo::Logger::instance().event(name, fields)

} // namespace solo

#endif // SOLO_LOGGER_HPP
