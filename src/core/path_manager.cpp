#include "solo/path_manager.hpp"
#include "solo/logger.hpp"
#include <cstdlib>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <cstring>

namespace solo {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride) {
    rootDir_ = resolveRoot(rootOverride);
    logsDir_ = rootDir_ / "logs";

    std::error_code ec;
    std::filesystem::create_directories(logsDir_, ec);
    if (ec) {
        std::cerr << "[solo] Cannot create " << logsDir_ << ": " << ec.message() << "\n";
    }

    // Generate path for current session log
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "solo_" << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S") << ".log";
    currentLogPath_ = logsDir_ / ss.str();
}

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("SOLO_STATE_DIR");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    // Fallback to XDG / Home
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";

    const char* xdgStateHome = std::getenv("XDG_STATE_HOME");
    if (xdgStateHome && strlen(xdgStateHome) > 0) {
        return std::filesystem::absolute(xdgStateHome) / "solo";
    }

    return std::filesystem::path(home) / ".local" / "state" / "solo";
}

namespace {

std::filesystem::path homeFile(const char* name) {
    const char* home = std::getenv("HOME");
    if (!home || strlen(home) == 0) return {};
    return std::filesystem::path(home) / name;
}

} // namespace

std::filesystem::path PathManager::legacyProcessRecord() {
    return homeFile(".solo.pid");
}

std::filesystem::path PathManager::legacyBuildRecord() {
    return homeFile(".solo.build");
}

std::vector<std::filesystem::path> PathManager::legacyRecords() const {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    for (const auto& p : {legacyProcessRecord(), legacyBuildRecord()}) {
        if (!p.empty() && std::filesystem::exists(p, ec)) found.push_back(p);
    }
    return found;
}

} // namespace solo
