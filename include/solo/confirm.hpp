#ifndef SOLO_CONFIRM_HPP
#define SOLO_CONFIRM_HPP

#include "solo/resolution.hpp"

#include <memory>
#include <optional>
#include <string>

namespace solo {

// Answers every request the same way. Used for --on-conflict and
// non-interactive sessions.
class FixedConfirmer : public Confirmer {
public:
  explicit FixedConfirmer(Choice choice) : choice_(choice) {}

  std::optional<Choice> confirm(const ConfirmRequest &request,
                                std::chrono::milliseconds timeout) override;

private:
  Choice choice_;
};

// Prompts on a terminal and reads one of r/k/a from inputFd.
class TerminalConfirmer : public Confirmer {
public:
  explicit TerminalConfirmer(int inputFd = 0, int outputFd = 1)
      : inputFd_(inputFd), outputFd_(outputFd) {}

  std::optional<Choice> confirm(const ConfirmRequest &request,
                                std::chrono::milliseconds timeout) override;

  // "r"/"replace", "k"/"keep", "a"/"abort"; nullopt for anything else.
  static std::optional<Choice> parseAnswer(const std::string &line);

private:
  int inputFd_;
  int outputFd_;

  void print(const std::string &text);
};

std::optional<Choice> parseChoice(const std::string &name);

// Text block shared by the prompt surfaces.
std::string formatRequest(const ConfirmRequest &request);

// Picks the surface for a configured mode (auto, gui, terminal, keep,
// replace, abort).
std::unique_ptr<Confirmer> makeConfirmer(const std::string &mode);

} // namespace solo

#endif // SOLO_CONFIRM_HPP
