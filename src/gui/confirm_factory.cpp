#include "solo/confirm.hpp"
#include "solo/gui.hpp"
#include "solo/logger.hpp"
#include <cstdlib>
#include <unistd.h>

namespace solo {

std::unique_ptr<Confirmer> makeConfirmer(const std::string &mode) {
  if (auto fixed = parseChoice(mode))
    return std::make_unique<FixedConfirmer>(*fixed);

  if (mode == "gui")
    return std::make_unique<GuiConfirmer>();
  if (mode == "terminal")
    return std::make_unique<TerminalConfirmer>();

  // auto
  const char *display = std::getenv("DISPLAY");
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  bool hasDisplay = (display && *display) || (wayland && *wayland);
  if (hasDisplay)
    return std::make_unique<GuiConfirmer>(isatty(STDIN_FILENO) != 0);
  if (isatty(STDIN_FILENO))
    return std::make_unique<TerminalConfirmer>();

  LOG_INFO("No display and no terminal; conflicts keep the running instance");
  return std::make_unique<FixedConfirmer>(Choice::KeepExisting);
}

} // namespace solo
