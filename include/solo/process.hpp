#ifndef SOLO_PROCESS_HPP
#define SOLO_PROCESS_HPP

#include <string>
#include <vector>
#include <optional>

namespace solo {

struct ProcessInfo {
    int pid;
    std::string exe;
};

class Process {
public:
    static int currentPid();

    // Signal-zero probe. A process owned by another user (EPERM) exists.
    static bool exists(int pid);

    // Exited but not yet reaped by its parent.
    static bool isZombie(int pid);

    // Target of /proc/<pid>/exe with any " (deleted)" suffix removed.
    // nullopt when the link cannot be read (foreign process, no procfs).
    static std::optional<std::string> getProcessExe(int pid);

    // Finds all processes whose image is exactly `exe`
    static std::vector<ProcessInfo> findByExe(const std::string& exe);

    // Sends SIGKILL (force) or SIGTERM. Returns 0 or the errno of kill(2).
    static int signal(int pid, bool force);

    static std::optional<std::string> selfExe();
};

} // namespace solo

#endif // SOLO_PROCESS_HPP
