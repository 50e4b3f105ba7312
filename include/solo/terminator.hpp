#ifndef SOLO_TERMINATOR_HPP
#define SOLO_TERMINATOR_HPP

#include "solo/liveness.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace solo {

struct TerminationBudget {
  int pollAttempts = 8;
  std::chrono::milliseconds initialInterval{100};
  double backoffFactor = 2.0;
  std::chrono::milliseconds maxInterval{2000};
  int killPollAttempts = 10;
  std::chrono::milliseconds killPollInterval{200};

  // Total sleep if the process never dies.
  std::chrono::milliseconds worstCase() const;
};

// Signalling seam. Both return 0 or the errno of kill(2).
class ProcessControl {
public:
  virtual ~ProcessControl() = default;
  virtual int terminate(int pid) = 0;
  virtual int kill(int pid) = 0;
};

class SystemProcessControl : public ProcessControl {
public:
  int terminate(int pid) override;
  int kill(int pid) override;
};

enum class TerminationState { Idle, Signaled, Polling, Escalated, Dead, TimedOut };

std::string toString(TerminationState s);

// Idle -> Signaled -> Polling -> Dead
//                            \-> Escalated -> Dead | TimedOut
// Each step() performs exactly one transition.
class TerminationMachine {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  TerminationMachine(int pid, std::string expectedExe, ProcessControl &control,
                     LivenessProbe &probe, TerminationBudget budget,
                     Sleeper sleeper = nullptr);

  TerminationState step();
  TerminationState run();

  TerminationState state() const { return state_; }
  bool finished() const {
    return state_ == TerminationState::Dead ||
           state_ == TerminationState::TimedOut;
  }

  int pid() const { return pid_; }
  int pollCount() const { return polls_; }
  int killPollCount() const { return killPolls_; }
  bool forced() const { return forced_; }
  std::chrono::milliseconds currentInterval() const { return interval_; }
  std::chrono::milliseconds waited() const { return waited_; }

private:
  int pid_;
  std::string expectedExe_;
  ProcessControl &control_;
  LivenessProbe &probe_;
  TerminationBudget budget_;
  Sleeper sleeper_;

  TerminationState state_ = TerminationState::Idle;
  int polls_ = 0;
  int killPolls_ = 0;
  bool forced_ = false;
  std::chrono::milliseconds interval_{0};
  std::chrono::milliseconds waited_{0};

  void sleep(std::chrono::milliseconds d);
  TerminationState escalate();
};

} // namespace solo

#endif // SOLO_TERMINATOR_HPP
