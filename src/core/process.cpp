#include "solo/process.hpp"
#include <filesystem>
#include <fstream>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <algorithm>
#include <cctype>

namespace solo {

int Process::currentPid() {
    return static_cast<int>(getpid());
}

bool Process::exists(int pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

bool Process::isZombie(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return false;

    std::string line;
    std::getline(stat, line);
    // comm may contain spaces and parentheses; the state follows the last ')'
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return false;
    char state = line[close + 2];
    return state == 'Z' || state == 'X';
}

std::optional<std::string> Process::getProcessExe(int pid) {
    std::filesystem::path exePath = std::filesystem::path("/proc") / std::to_string(pid) / "exe";
    std::error_code ec;
    auto target = std::filesystem::read_symlink(exePath, ec);
    if (ec) return std::nullopt;

    std::string exe = target.string();
    const std::string deleted = " (deleted)";
    if (exe.size() > deleted.size() &&
        exe.compare(exe.size() - deleted.size(), deleted.size(), deleted) == 0) {
        exe.erase(exe.size() - deleted.size());
    }
    return exe;
}

std::vector<ProcessInfo> Process::findByExe(const std::string& exe) {
    std::vector<ProcessInfo> found;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        std::string dirname = entry.path().filename().string();
        bool numeric = !dirname.empty() &&
                       std::all_of(dirname.begin(), dirname.end(), [](char c) {
                           return std::isdigit(static_cast<unsigned char>(c)) != 0;
                       });
        if (!numeric) continue;

        int pid = std::stoi(dirname);
        auto procExe = getProcessExe(pid);
        if (procExe && *procExe == exe && !isZombie(pid)) {
            found.push_back({pid, *procExe});
        }
    }
    return found;
}

int Process::signal(int pid, bool force) {
    if (pid <= 0) return ESRCH;
    return ::kill(pid, force ? SIGKILL : SIGTERM) == 0 ? 0 : errno;
}

std::optional<std::string> Process::selfExe() {
    std::error_code ec;
    auto exe = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec) return std::nullopt;
    return exe.string();
}

} // namespace solo
