#include <doctest/doctest.h>

#include "solo/terminator.hpp"
#include "test_helpers.hpp"

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

using namespace solo;
using solo::test::FakeControl;
using solo::test::FakeProbe;

namespace {

TerminationBudget smallBudget() {
    TerminationBudget b;
    b.pollAttempts = 4;
    b.initialInterval = std::chrono::milliseconds(10);
    b.backoffFactor = 2.0;
    b.maxInterval = std::chrono::milliseconds(40);
    b.killPollAttempts = 3;
    b.killPollInterval = std::chrono::milliseconds(5);
    return b;
}

struct Sleeps {
    std::vector<long long> ms;
    TerminationMachine::Sleeper sleeper() {
        return [this](std::chrono::milliseconds d) { ms.push_back(d.count()); };
    }
};

} // namespace

TEST_CASE("TerminationMachine: graceful exit walks Idle, Signaled, Polling, Dead")
{
    FakeProbe probe;
    probe.alive = {500};
    FakeControl control(probe);
    Sleeps sleeps;

    TerminationMachine m(500, "", control, probe, smallBudget(), sleeps.sleeper());
    CHECK(m.state() == TerminationState::Idle);
    CHECK(m.step() == TerminationState::Signaled);
    CHECK(control.terminated == std::vector<int>{500});
    CHECK(m.step() == TerminationState::Polling);

    // Dies between the second and third poll.
    CHECK(m.step() == TerminationState::Polling);
    probe.alive.clear();
    CHECK(m.step() == TerminationState::Dead);
    CHECK(m.finished());
    CHECK(m.pollCount() == 2);
    CHECK_FALSE(m.forced());
    CHECK(control.killed.empty());
    CHECK(sleeps.ms == std::vector<long long>{10, 20});
}

TEST_CASE("TerminationMachine: poll interval backs off up to the cap")
{
    FakeProbe probe;
    probe.alive = {7};
    FakeControl control(probe);
    control.diesOnKill = {7};
    Sleeps sleeps;

    TerminationMachine m(7, "", control, probe, smallBudget(), sleeps.sleeper());
    CHECK(m.run() == TerminationState::Dead);
    CHECK(m.forced());
    CHECK(m.pollCount() == 4);
    CHECK(m.killPollCount() == 1);
    // 10, 20, 40, 40 graceful, then one forced poll.
    CHECK(sleeps.ms == std::vector<long long>{10, 20, 40, 40, 5});
    CHECK(m.waited().count() == 115);
}

TEST_CASE("TerminationMachine: survives SIGKILL until the budget runs out")
{
    FakeProbe probe;
    probe.alive = {9};
    FakeControl control(probe);
    Sleeps sleeps;

    auto budget = smallBudget();
    TerminationMachine m(9, "", control, probe, budget, sleeps.sleeper());
    CHECK(m.run() == TerminationState::TimedOut);
    CHECK(m.killPollCount() == budget.killPollAttempts);
    CHECK(control.killed == std::vector<int>{9});
    CHECK(m.waited() == budget.worstCase());
}

TEST_CASE("TerminationMachine: already gone at signal time")
{
    FakeProbe probe;
    FakeControl control(probe);
    Sleeps sleeps;

    TerminationMachine m(11, "", control, probe, smallBudget(), sleeps.sleeper());
    CHECK(m.step() == TerminationState::Dead);
    CHECK(sleeps.ms.empty());
}

TEST_CASE("TerminationMachine: permission denied escalates and then times out")
{
    FakeProbe probe;
    probe.alive = {12};
    FakeControl control(probe);
    control.termRc = EPERM;
    control.killRc = EPERM;
    Sleeps sleeps;

    TerminationMachine m(12, "", control, probe, smallBudget(), sleeps.sleeper());
    CHECK(m.step() == TerminationState::TimedOut);
    CHECK(m.forced());
    CHECK(sleeps.ms.empty());
}

TEST_CASE("TerminationMachine: degenerate budgets still make progress")
{
    FakeProbe probe;
    probe.alive = {13};
    FakeControl control(probe);
    Sleeps sleeps;

    TerminationBudget budget;
    budget.pollAttempts = 0;
    budget.killPollAttempts = 0;
    budget.backoffFactor = 0.5;
    budget.initialInterval = std::chrono::milliseconds(1);
    budget.killPollInterval = std::chrono::milliseconds(1);

    TerminationMachine m(13, "", control, probe, budget, sleeps.sleeper());
    CHECK(m.run() == TerminationState::TimedOut);
    CHECK(m.pollCount() == 1);
    CHECK(m.killPollCount() == 1);
}

TEST_CASE("TerminationMachine: a huge backoff factor saturates at the cap")
{
    FakeProbe probe;
    probe.alive = {21};
    FakeControl control(probe);
    Sleeps sleeps;

    TerminationBudget budget;
    budget.pollAttempts = 4;
    budget.initialInterval = std::chrono::milliseconds(10);
    budget.backoffFactor = 1e300;
    budget.maxInterval = std::chrono::milliseconds(50);
    budget.killPollAttempts = 1;
    budget.killPollInterval = std::chrono::milliseconds(5);

    CHECK(budget.worstCase().count() == 10 + 50 + 50 + 50 + 5);

    TerminationMachine m(21, "", control, probe, budget, sleeps.sleeper());
    CHECK(m.run() == TerminationState::TimedOut);
    CHECK(sleeps.ms == std::vector<long long>{10, 50, 50, 50, 5});
}

TEST_CASE("TerminationBudget: default worst case")
{
    TerminationBudget b;
    // 100+200+400+800+1600+2000+2000+2000 graceful, 10 x 200 forced
    CHECK(b.worstCase().count() == 9100 + 2000);
}

TEST_CASE("TerminationMachine: stops a real child process")
{
    pid_t child = fork();
    if (child == 0) {
        std::signal(SIGTERM, SIG_DFL);
        while (true) pause();
    }
    REQUIRE(child > 0);

    // Reaps the child as soon as it exits so the probe sees it gone.
    class ReapingProbe : public LivenessProbe {
    public:
        explicit ReapingProbe(pid_t pid) : pid_(pid) {}
        bool isAlive(int pid, const std::string&) override {
            if (pid == pid_ && waitpid(pid_, nullptr, WNOHANG) == pid_) return false;
            return ::kill(pid, 0) == 0;
        }

    private:
        pid_t pid_;
    } probe(child);

    SystemProcessControl control;
    TerminationMachine m(child, "", control, probe, smallBudget());
    CHECK(m.run() == TerminationState::Dead);
}
