#include <doctest/doctest.h>

#include "solo/liveness.hpp"
#include "solo/process.hpp"

#include <chrono>
#include <optional>
#include <csignal>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace solo;

namespace {

pid_t spawnSleeper() {
    pid_t child = fork();
    if (child == 0) {
        // the test runner's crash handlers are inherited
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGINT, SIG_DFL);
        while (true) pause();
    }
    return child;
}

// Polls until the child has turned into a zombie (it exits on its own).
pid_t spawnZombie() {
    pid_t child = fork();
    if (child == 0) _exit(0);
    for (int i = 0; i < 200 && !Process::isZombie(child); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return child;
}

} // namespace

TEST_CASE("SystemLivenessProbe: running child is alive, reaped child is not")
{
    SystemLivenessProbe probe;
    pid_t child = spawnSleeper();
    REQUIRE(child > 0);

    CHECK(probe.isAlive(child));
    CHECK(Process::exists(child));

    kill(child, SIGKILL);
    waitpid(child, nullptr, 0);

    CHECK_FALSE(probe.isAlive(child));
}

TEST_CASE("SystemLivenessProbe: an unreaped zombie is not alive")
{
    SystemLivenessProbe probe;
    pid_t child = spawnZombie();
    REQUIRE(child > 0);

    CHECK(Process::exists(child));
    CHECK(Process::isZombie(child));
    CHECK_FALSE(probe.isAlive(child));

    waitpid(child, nullptr, 0);
}

TEST_CASE("SystemLivenessProbe: invalid pids are never alive")
{
    SystemLivenessProbe probe;
    CHECK_FALSE(probe.isAlive(0));
    CHECK_FALSE(probe.isAlive(-1));
    CHECK_FALSE(probe.isAlive(0x3ffffff0));
}

TEST_CASE("SystemLivenessProbe: a pid running another executable was recycled")
{
    int self = Process::currentPid();
    auto exe = Process::selfExe();
    REQUIRE(exe.has_value());

    SystemLivenessProbe verifying(true);
    CHECK(verifying.isAlive(self, *exe));
    CHECK(verifying.isAlive(self));
    CHECK_FALSE(verifying.isAlive(self, "/nonexistent/solo-other-build"));

    SystemLivenessProbe trusting(false);
    CHECK(trusting.isAlive(self, "/nonexistent/solo-other-build"));
}

TEST_CASE("SystemLivenessProbe: an image that cannot be read counts as alive")
{
    int self = Process::currentPid();
    std::vector<int> looked;
    SystemLivenessProbe probe(true, [&](int pid) -> std::optional<std::string> {
        looked.push_back(pid);
        return std::nullopt;
    });

    CHECK(probe.isAlive(self, "/some/exe"));
    REQUIRE(looked.size() == 1);
    CHECK(looked[0] == self);

    // The lookup is only consulted for a live pid.
    CHECK_FALSE(probe.isAlive(0x3ffffff0, "/some/exe"));
    CHECK(looked.size() == 1);
}

TEST_CASE("SystemLivenessProbe: a lossy recorded path skips the image check")
{
    int self = Process::currentPid();
    bool consulted = false;
    SystemLivenessProbe probe(true, [&](int) -> std::optional<std::string> {
        consulted = true;
        return std::string("/opt/caf\xe9/solo");
    });

    CHECK(probe.isAlive(self, "/opt/caf\xEF\xBF\xBD/solo"));
    CHECK_FALSE(consulted);

    CHECK_FALSE(probe.isAlive(self, "/opt/other/solo"));
    CHECK(consulted);
}

TEST_CASE("Process::signal reports errno")
{
    CHECK(Process::signal(0, false) == ESRCH);
    CHECK(Process::signal(0x3ffffff0, false) == ESRCH);

    pid_t child = spawnSleeper();
    CHECK(Process::signal(child, false) == 0);
    int status = 0;
    waitpid(child, &status, 0);
    CHECK(WIFSIGNALED(status));
    CHECK(WTERMSIG(status) == SIGTERM);
}

TEST_CASE("Process::getProcessExe resolves this process")
{
    auto exe = Process::getProcessExe(Process::currentPid());
    REQUIRE(exe.has_value());
    CHECK(*exe == *Process::selfExe());

    auto found = Process::findByExe(*exe);
    bool sawSelf = false;
    for (const auto& p : found) {
        if (p.pid == Process::currentPid()) sawSelf = true;
    }
    CHECK(sawSelf);
}
