#include "solo/terminator.hpp"
#include "solo/logger.hpp"
#include "solo/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

namespace solo {

namespace {

// Multiplies in floating point so a large factor saturates at the cap.
std::chrono::milliseconds nextInterval(std::chrono::milliseconds current,
                                       double factor,
                                       std::chrono::milliseconds cap) {
  double next = static_cast<double>(current.count()) * factor;
  if (!(next < static_cast<double>(cap.count())))
    return cap;
  return std::chrono::milliseconds(static_cast<long long>(next));
}

} // namespace

std::chrono::milliseconds TerminationBudget::worstCase() const {
  std::chrono::milliseconds total{0};
  auto interval = initialInterval;
  for (int i = 0; i < pollAttempts; ++i) {
    total += interval;
    interval = nextInterval(interval, backoffFactor, maxInterval);
  }
  return total + killPollInterval * killPollAttempts;
}

int SystemProcessControl::terminate(int pid) {
  return Process::signal(pid, false);
}

int SystemProcessControl::kill(int pid) { return Process::signal(pid, true); }

std::string toString(TerminationState s) {
  switch (s) {
  case TerminationState::Idle:
    return "Idle";
  case TerminationState::Signaled:
    return "Signaled";
  case TerminationState::Polling:
    return "Polling";
  case TerminationState::Escalated:
    return "Escalated";
  case TerminationState::Dead:
    return "Dead";
  case TerminationState::TimedOut:
    return "TimedOut";
  }
  return "Unknown";
}

TerminationMachine::TerminationMachine(int pid, std::string expectedExe,
                                       ProcessControl &control,
                                       LivenessProbe &probe,
                                       TerminationBudget budget,
                                       Sleeper sleeper)
    : pid_(pid), expectedExe_(std::move(expectedExe)), control_(control),
      probe_(probe), budget_(budget), sleeper_(std::move(sleeper)) {
  if (budget_.pollAttempts < 1)
    budget_.pollAttempts = 1;
  if (budget_.killPollAttempts < 1)
    budget_.killPollAttempts = 1;
  if (budget_.backoffFactor < 1.0)
    budget_.backoffFactor = 1.0;
}

void TerminationMachine::sleep(std::chrono::milliseconds d) {
  waited_ += d;
  if (sleeper_)
    sleeper_(d);
  else
    std::this_thread::sleep_for(d);
}

TerminationState TerminationMachine::escalate() {
  forced_ = true;
  int rc = control_.kill(pid_);
  if (rc == ESRCH) {
    state_ = TerminationState::Dead;
  } else if (rc != 0) {
    LOG_ERROR("Failed to force-kill pid " + std::to_string(pid_) + ": " +
              strerror(rc));
    state_ = TerminationState::TimedOut;
  } else {
    LOG_WARN("Process " + std::to_string(pid_) +
             " ignored SIGTERM, sent SIGKILL");
    state_ = TerminationState::Escalated;
  }
  return state_;
}

TerminationState TerminationMachine::step() {
  switch (state_) {
  case TerminationState::Idle: {
    int rc = control_.terminate(pid_);
    if (rc == 0) {
      state_ = TerminationState::Signaled;
    } else if (rc == ESRCH) {
      state_ = TerminationState::Dead;
    } else {
      LOG_WARN("SIGTERM to pid " + std::to_string(pid_) + " failed: " +
               strerror(rc));
      escalate();
    }
    break;
  }

  case TerminationState::Signaled:
    interval_ = budget_.initialInterval;
    polls_ = 0;
    state_ = TerminationState::Polling;
    break;

  case TerminationState::Polling:
    sleep(interval_);
    ++polls_;
    if (!probe_.isAlive(pid_, expectedExe_)) {
      state_ = TerminationState::Dead;
      break;
    }
    interval_ = nextInterval(interval_, budget_.backoffFactor, budget_.maxInterval);
    if (polls_ >= budget_.pollAttempts)
      escalate();
    break;

  case TerminationState::Escalated:
    sleep(budget_.killPollInterval);
    ++killPolls_;
    if (!probe_.isAlive(pid_, expectedExe_))
      state_ = TerminationState::Dead;
    else if (killPolls_ >= budget_.killPollAttempts)
      state_ = TerminationState::TimedOut;
    break;

  case TerminationState::Dead:
  case TerminationState::TimedOut:
    break;
  }
  return state_;
}

TerminationState TerminationMachine::run() {
  while (!finished())
    step();
  return state_;
}

} // namespace solo
