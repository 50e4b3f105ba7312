#ifndef SOLO_RESOLUTION_HPP
#define SOLO_RESOLUTION_HPP

#include "solo/classifier.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace solo {

enum class Choice { Replace, KeepExisting, Abort };

enum class Action {
  ProceedAndClaim, // write identity, continue start-up
  ReplaceAndClaim, // terminate the prior process first, then claim
  AbortLaunch      // exit without touching persisted state
};

std::string toString(Choice c);
std::string toString(Action a);

struct ConfirmRequest {
  Classification classification = Classification::LiveSameBuild;
  std::string currentVersion;
  std::string currentBuildId;
  std::string priorVersion;
  std::string priorBuildId;
  int priorPid = 0;
  std::string message;
};

// The user-facing decision surface. Blocks until the user answers, the
// timeout elapses (nullopt) or a shutdown is requested (Abort).
class Confirmer {
public:
  virtual ~Confirmer() = default;
  virtual std::optional<Choice> confirm(const ConfirmRequest &request,
                                        std::chrono::milliseconds timeout) = 0;
};

struct Resolution {
  Action action = Action::AbortLaunch;
  std::optional<Choice> choice; // what the user picked, if asked
  bool asked = false;
  bool timedOut = false;
  bool cancelled = false; // shutdown requested while deciding
};

class ResolutionPolicy {
public:
  ResolutionPolicy(Confirmer &confirmer, std::chrono::milliseconds timeout,
                   std::function<bool()> shutdownRequested = nullptr);

  Resolution resolve(Classification classification,
                     const ConfirmRequest &request);

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  Confirmer &confirmer_;
  std::chrono::milliseconds timeout_;
  std::function<bool()> shutdownRequested_;
};

} // namespace solo

#endif // SOLO_RESOLUTION_HPP
