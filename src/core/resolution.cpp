#include "solo/resolution.hpp"
#include "solo/logger.hpp"
#include "solo/signals.hpp"

namespace solo {

std::string toString(Choice c) {
  switch (c) {
  case Choice::Replace:
    return "Replace";
  case Choice::KeepExisting:
    return "KeepExisting";
  case Choice::Abort:
    return "Abort";
  }
  return "Unknown";
}

std::string toString(Action a) {
  switch (a) {
  case Action::ProceedAndClaim:
    return "ProceedAndClaim";
  case Action::ReplaceAndClaim:
    return "ReplaceAndClaim";
  case Action::AbortLaunch:
    return "AbortLaunch";
  }
  return "Unknown";
}

ResolutionPolicy::ResolutionPolicy(Confirmer &confirmer,
                                   std::chrono::milliseconds timeout,
                                   std::function<bool()> shutdownRequested)
    : confirmer_(confirmer), timeout_(timeout),
      shutdownRequested_(shutdownRequested ? std::move(shutdownRequested)
                                           : &ShutdownSignal::requested) {}

Resolution ResolutionPolicy::resolve(Classification classification,
                                     const ConfirmRequest &request) {
  Resolution result;

  if (classification == Classification::NoPriorInstance ||
      classification == Classification::StaleRecord) {
    result.action = Action::ProceedAndClaim;
    return result;
  }

  if (shutdownRequested_()) {
    result.cancelled = true;
    result.choice = Choice::Abort;
    result.action = Action::AbortLaunch;
    return result;
  }

  result.asked = true;
  auto started = std::chrono::steady_clock::now();
  std::optional<Choice> answer;
  try {
    answer = confirmer_.confirm(request, timeout_);
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("Confirmation failed: ") + e.what() +
              "; keeping the running instance");
    answer = Choice::KeepExisting;
  }
  auto elapsed = std::chrono::steady_clock::now() - started;

  if (shutdownRequested_()) {
    result.cancelled = true;
    answer = Choice::Abort;
  } else if (!answer || elapsed > timeout_) {
    // a late answer counts as no answer
    result.timedOut = true;
    answer = Choice::KeepExisting;
  }

  result.choice = answer;
  result.action =
      *answer == Choice::Replace ? Action::ReplaceAndClaim : Action::AbortLaunch;
  return result;
}

} // namespace solo
