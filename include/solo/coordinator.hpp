#ifndef SOLO_COORDINATOR_HPP
#define SOLO_COORDINATOR_HPP

#include "solo/classifier.hpp"
#include "solo/identity_store.hpp"
#include "solo/liveness.hpp"
#include "solo/resolution.hpp"
#include "solo/terminator.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace solo {

enum class Decision { Proceed, Exit };

std::string toString(Decision d);

struct StartupOutcome {
  Decision decision = Decision::Exit;
  Classification classification = Classification::NoPriorInstance;
  std::optional<Action> action;
  bool claimed = false;

  // False when identity could not be persisted for this run.
  bool enforcementReliable = true;
  int racesDetected = 0;

  // Messages the host should show the user.
  std::vector<std::string> warnings;
};

struct CoordinatorOptions {
  std::chrono::milliseconds confirmTimeout{30000};
  TerminationBudget termination;

  // 0 means the calling process
  int selfPid = 0;

  // Re-classifications allowed after losing a claim race.
  int raceRetries = 1;

  // Test seams; empty means the real clock / sleep / shutdown flag.
  TerminationMachine::Sleeper sleeper;
  std::function<bool()> shutdownRequested;
  std::function<std::chrono::system_clock::time_point()> clock;
};

class InstanceCoordinator {
public:
  InstanceCoordinator(IdentityStore &store, LivenessProbe &probe,
                      Confirmer &confirmer, ProcessControl &control,
                      CoordinatorOptions options = {});

  // Reads, classifies, resolves and (when allowed) claims identity.
  // Never throws for the failure modes of the protocol.
  StartupOutcome startup(const BuildRecord &currentBuild);

  // Graceful shutdown. Clears the records only while they still name this
  // process.
  void shutdown();

  // Re-reads the store and checks the process record names this process.
  bool ownsIdentity();

  bool claimed() const { return claimed_; }
  int selfPid() const { return selfPid_; }

private:
  IdentityStore &store_;
  LivenessProbe &probe_;
  ProcessControl &control_;
  CoordinatorOptions options_;
  ResolutionPolicy policy_;
  int selfPid_;
  bool claimed_ = false;

  bool priorAlive(const IdentitySnapshot &snapshot);
  ConfirmRequest makeRequest(Classification c, const BuildRecord &current,
                             const IdentitySnapshot &snapshot) const;
  void terminatePrior(const IdentitySnapshot &snapshot);
  void claim(const BuildRecord &currentBuild, const IdentitySnapshot &expected,
             bool priorTerminated);
};

} // namespace solo

#endif // SOLO_COORDINATOR_HPP
