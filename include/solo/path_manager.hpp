#ifndef SOLO_PATH_MANAGER_HPP
#define SOLO_PATH_MANAGER_HPP

#include <string>
#include <filesystem>
#include <vector>

namespace solo {

class PathManager {
public:
    static PathManager& instance();

    // Initializes paths based on optional root override.
    // If rootOverride is empty, it checks SOLO_STATE_DIR env, then XDG defaults.
    void init(const std::string& rootOverride = "");

    std::filesystem::path root() const { return rootDir_; }
    std::filesystem::path logs() const { return logsDir_; }
    std::filesystem::path config() const { return rootDir_ / "config.json"; }

    // Identity records
    std::filesystem::path processRecord() const { return rootDir_ / "solo.pid"; }
    std::filesystem::path buildRecord() const { return rootDir_ / "solo.build"; }
    std::filesystem::path lockFile() const { return rootDir_ / "solo.lock"; }

    // Returns the path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

    // Locations of the old layout's dotfiles. Empty when HOME is unset.
    static std::filesystem::path legacyProcessRecord();
    static std::filesystem::path legacyBuildRecord();

    // Dotfiles left in $HOME by the old layout, if any
    std::vector<std::filesystem::path> legacyRecords() const;

    static std::filesystem::path resolveRoot(const std::string& override);

private:
    PathManager() = default;

    std::filesystem::path rootDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path currentLogPath_;
};

} // namespace solo

#endif // SOLO_PATH_MANAGER_HPP
