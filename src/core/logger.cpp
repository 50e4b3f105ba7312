#include "solo/logger.hpp"

#include <algorithm>
#include <sstream>

namespace solo {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;

    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << logPath << std::endl;
    } else {
        logPath_ = logPath;
        logFile_ << "\n=== solo session started: " << getTimestamp() << " ===\n";
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string timestamp = getTimestamp();
    std::string levelStr = getLevelString(level);
    std::string formattedMsg = "[" + timestamp + "] [" + levelStr + "] " + message;

    if (logFile_.is_open()) {
        logFile_ << formattedMsg << std::endl;
    }

    if (verbose_ || level == LogLevel::WARNING || level == LogLevel::ERROR) {
        if (level == LogLevel::ERROR) {
            std::cerr << formattedMsg << std::endl;
        } else {
            std::cout << formattedMsg << std::endl;
        }
    }

    for (const auto& sink : sinks_) {
        sink.second(level, message);
    }
}

void Logger::event(const std::string& name, const nlohmann::json& fields) {
    log(LogLevel::EVENT,
        name + " " + fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

int Logger::addSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = nextSinkId_++;
    sinks_.emplace_back(id, std::move(sink));
    return id;
}

void Logger::removeSink(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove_if(sinks_.begin(), sinks_.end(),
                                [id](const auto& s) { return s.first == id; }),
                 sinks_.end());
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::EVENT:   return "EVENT";
        default:                return "UNKNOWN";
    }
}

} // namespace solo
