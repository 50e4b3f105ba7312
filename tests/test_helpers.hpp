#ifndef SOLO_TEST_HELPERS_HPP
#define SOLO_TEST_HELPERS_HPP

#include "solo/identity.hpp"
#include "solo/liveness.hpp"
#include "solo/logger.hpp"
#include "solo/resolution.hpp"
#include "solo/terminator.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

namespace solo::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "solo_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* made = mkdtemp(buf.data());
        path_ = made ? std::filesystem::path(made) : std::filesystem::path(tmpl);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline BuildRecord makeBuild(const std::string& id, const std::string& version,
                             std::int64_t unixTimestamp = 0) {
    BuildRecord b;
    b.buildId = id;
    b.version = version;
    b.executablePath = "/opt/solo/bin/solo";
    b.unixTimestamp = unixTimestamp;
    return b;
}

inline ProcessRecord makeProcess(int pid, std::int64_t secondsSinceEpoch = 1700000000) {
    ProcessRecord p;
    p.pid = pid;
    p.recordedAt = std::chrono::system_clock::time_point(std::chrono::seconds(secondsSinceEpoch));
    return p;
}

// Liveness answered from a set of pids.
class FakeProbe : public LivenessProbe {
public:
    std::set<int> alive;
    int calls = 0;

    bool isAlive(int pid, const std::string& = "") override {
        ++calls;
        return alive.count(pid) > 0;
    }
};

// Records signals. A pid in `diesOnTerm` / `diesOnKill` leaves the probe's
// alive set when signalled.
class FakeControl : public ProcessControl {
public:
    explicit FakeControl(FakeProbe& probe) : probe_(probe) {}

    std::set<int> diesOnTerm;
    std::set<int> diesOnKill;
    int termRc = 0;
    int killRc = 0;
    std::vector<int> terminated;
    std::vector<int> killed;

    int terminate(int pid) override {
        terminated.push_back(pid);
        if (termRc != 0) return termRc;
        if (!probe_.alive.count(pid)) return ESRCH;
        if (diesOnTerm.count(pid)) probe_.alive.erase(pid);
        return 0;
    }
    int kill(int pid) override {
        killed.push_back(pid);
        if (killRc != 0) return killRc;
        if (!probe_.alive.count(pid)) return ESRCH;
        if (diesOnKill.count(pid)) probe_.alive.erase(pid);
        return 0;
    }

private:
    FakeProbe& probe_;
};

// Returns scripted answers in order, then nullopt.
class ScriptedConfirmer : public Confirmer {
public:
    std::vector<std::optional<Choice>> answers;
    std::vector<ConfirmRequest> requests;
    std::chrono::milliseconds delay{0};
    std::function<void()> onConfirm;

    std::optional<Choice> confirm(const ConfirmRequest& request,
                                  std::chrono::milliseconds) override {
        requests.push_back(request);
        if (onConfirm) onConfirm();
        if (delay.count() > 0) usleep(static_cast<useconds_t>(delay.count() * 1000));
        if (requests.size() > answers.size()) return std::nullopt;
        return answers[requests.size() - 1];
    }
};

// Captures log lines for the lifetime of the object.
class LogCapture {
public:
    LogCapture() {
        id_ = Logger::instance().addSink([this](LogLevel level, const std::string& msg) {
            lines.push_back({level, msg});
        });
    }
    ~LogCapture() { Logger::instance().removeSink(id_); }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    // Events whose name matches, in order.
    std::vector<std::string> events(const std::string& name) const {
        std::vector<std::string> out;
        for (const auto& l : lines) {
            if (l.first == LogLevel::EVENT && l.second.rfind(name + " ", 0) == 0)
                out.push_back(l.second.substr(name.size() + 1));
        }
        return out;
    }

    std::vector<std::pair<LogLevel, std::string>> lines;

private:
    int id_ = 0;
};

} // namespace solo::test

#endif // SOLO_TEST_HELPERS_HPP
