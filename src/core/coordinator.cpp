#include "solo/coordinator.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include "solo/process.hpp"

namespace solo {

using json = nlohmann::json;

std::string toString(Decision d) {
  return d == Decision::Proceed ? "Proceed" : "Exit";
}

InstanceCoordinator::InstanceCoordinator(IdentityStore &store,
                                         LivenessProbe &probe,
                                         Confirmer &confirmer,
                                         ProcessControl &control,
                                         CoordinatorOptions options)
    : store_(store), probe_(probe), control_(control),
      options_(std::move(options)),
      policy_(confirmer, options_.confirmTimeout, options_.shutdownRequested),
      selfPid_(options_.selfPid > 0 ? options_.selfPid
                                    : Process::currentPid()) {
  if (!options_.clock)
    options_.clock = [] { return std::chrono::system_clock::now(); };
}

bool InstanceCoordinator::priorAlive(const IdentitySnapshot &snapshot) {
  if (!snapshot.process)
    return false;
  if (snapshot.process->pid == selfPid_) {
    // Our own pid in a record we never wrote: the writer is gone.
    LOG_INFO("Process record names this process; pid was reused");
    return false;
  }
  std::string exe = snapshot.build ? snapshot.build->executablePath : "";
  return probe_.isAlive(snapshot.process->pid, exe);
}

ConfirmRequest
InstanceCoordinator::makeRequest(Classification c, const BuildRecord &current,
                                 const IdentitySnapshot &snapshot) const {
  ConfirmRequest request;
  request.classification = c;
  request.currentVersion = current.version;
  request.currentBuildId = current.buildId;
  request.priorVersion = snapshot.build ? snapshot.build->version : "unknown";
  request.priorBuildId = snapshot.build ? snapshot.build->buildId : "unknown";
  request.priorPid = snapshot.process ? snapshot.process->pid : 0;
  request.message = describeCollision(c, current, snapshot.build);
  return request;
}

StartupOutcome InstanceCoordinator::startup(const BuildRecord &currentBuild) {
  StartupOutcome outcome;

  for (int attempt = 0;; ++attempt) {
    IdentitySnapshot snapshot = store_.readIdentity();
    bool alive = priorAlive(snapshot);
    Classification c =
        classify(currentBuild, snapshot.process, snapshot.build, alive);
    outcome.classification = c;

    LOG_EVENT("classification",
              json({{"attempt", attempt},
                    {"classification", toString(c)},
                    {"prior_pid", snapshot.process ? snapshot.process->pid : 0},
                    {"prior_alive", alive},
                    {"prior_build_id",
                     snapshot.build ? snapshot.build->buildId : ""},
                    {"prior_version",
                     snapshot.build ? snapshot.build->version : ""},
                    {"current_build_id", currentBuild.buildId},
                    {"current_version", currentBuild.version}}));

    Resolution resolution =
        policy_.resolve(c, makeRequest(c, currentBuild, snapshot));
    outcome.action = resolution.action;

    LOG_EVENT("resolution",
              json({{"classification", toString(c)},
                    {"action", toString(resolution.action)},
                    {"choice", resolution.choice
                                   ? toString(*resolution.choice)
                                   : ""},
                    {"asked", resolution.asked},
                    {"timed_out", resolution.timedOut},
                    {"cancelled", resolution.cancelled}}));

    if (resolution.action == Action::AbortLaunch) {
      if (resolution.cancelled && claimed_) {
        store_.clearIdentity();
        claimed_ = false;
      }
      outcome.decision = Decision::Exit;
      return outcome;
    }

    bool replaced = false;
    if (resolution.action == Action::ReplaceAndClaim) {
      try {
        terminatePrior(snapshot);
        replaced = true;
      } catch (const TerminationTimeout &e) {
        LOG_ERROR(e.what());
        outcome.warnings.push_back(
            "The running instance (pid " + std::to_string(e.pid()) +
            ") could not be stopped. It keeps running and this launch "
            "exits.");
        outcome.decision = Decision::Exit;
        return outcome;
      }
    }

    try {
      claim(currentBuild, snapshot, replaced);
      outcome.claimed = true;
      outcome.decision = Decision::Proceed;
      return outcome;
    } catch (const RaceDetected &e) {
      ++outcome.racesDetected;
      LOG_EVENT("race_detected",
                json({{"attempt", attempt}, {"reason", e.what()}}));
      if (attempt >= options_.raceRetries) {
        LOG_WARN("Lost the claim race again; leaving the other instance "
                 "running");
        outcome.decision = Decision::Exit;
        return outcome;
      }
    } catch (const PersistenceError &e) {
      LOG_EVENT("persistence_error", json({{"reason", e.what()}}));
      outcome.enforcementReliable = false;
      outcome.warnings.push_back(
          std::string("Could not record this instance (") + e.what() +
          "). Another copy may start alongside this one.");
      outcome.decision = Decision::Proceed;
      return outcome;
    }
  }
}

void InstanceCoordinator::terminatePrior(const IdentitySnapshot &snapshot) {
  int pid = snapshot.process->pid;
  std::string exe = snapshot.build ? snapshot.build->executablePath : "";

  LOG_INFO("Terminating prior instance pid " + std::to_string(pid));
  TerminationMachine machine(pid, exe, control_, probe_, options_.termination,
                             options_.sleeper);
  TerminationState final = machine.run();

  LOG_EVENT("termination",
            json({{"pid", pid},
                  {"state", toString(final)},
                  {"polls", machine.pollCount()},
                  {"kill_polls", machine.killPollCount()},
                  {"forced", machine.forced()},
                  {"waited_ms", machine.waited().count()}}));

  if (final != TerminationState::Dead)
    throw TerminationTimeout(pid);
}

void InstanceCoordinator::claim(const BuildRecord &currentBuild,
                                const IdentitySnapshot &expected,
                                bool priorTerminated) {
  auto held = store_.lock(LockMode::Exclusive);
  IdentitySnapshot now = store_.readIdentity();

  // A terminated owner may have removed its own records on the way out.
  bool clearedByPrior = priorTerminated && !now.process;
  if (!sameClaim(now, expected) && !clearedByPrior) {
    std::string who = now.process ? "pid " + std::to_string(now.process->pid)
                                  : std::string("removal");
    throw RaceDetected("identity changed since classification (" + who + ")");
  }

  if (now.process && now.process->pid != selfPid_) {
    std::string exe = now.build ? now.build->executablePath : "";
    if (probe_.isAlive(now.process->pid, exe))
      throw RaceDetected("pid " + std::to_string(now.process->pid) +
                         " is alive at claim time");
  }

  ProcessRecord record;
  record.pid = selfPid_;
  record.recordedAt = options_.clock();
  store_.writeIdentity(record, currentBuild);
  claimed_ = true;

  LOG_EVENT("claim", json({{"pid", selfPid_},
                           {"build_id", currentBuild.buildId},
                           {"version", currentBuild.version},
                           {"store", store_.describe()}}));
}

bool InstanceCoordinator::ownsIdentity() {
  IdentitySnapshot snapshot = store_.readIdentity();
  return snapshot.process && snapshot.process->pid == selfPid_;
}

void InstanceCoordinator::shutdown() {
  if (!claimed_)
    return;
  claimed_ = false;

  std::unique_ptr<StoreLock> held;
  try {
    held = store_.lock(LockMode::Exclusive);
  } catch (const PersistenceError &e) {
    LOG_DEBUG(std::string("Releasing identity without lock: ") + e.what());
  }

  IdentitySnapshot snapshot = store_.readIdentity();
  if (snapshot.process && snapshot.process->pid != selfPid_) {
    LOG_INFO("Identity now belongs to pid " +
             std::to_string(snapshot.process->pid) + "; leaving records");
    return;
  }
  store_.clearIdentity();
  LOG_EVENT("release", json({{"pid", selfPid_}}));
}

} // namespace solo
