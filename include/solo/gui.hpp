#ifndef SOLO_GUI_HPP
#define SOLO_GUI_HPP

#include "solo/resolution.hpp"

#include <optional>
#include <string>

namespace solo {

// Modal conflict dialog: Replace / Keep Existing / Cancel Launch with a
// countdown. Closing the window counts as Cancel Launch.
class GuiConfirmer : public Confirmer {
public:
  // With terminalFallback set, a display that cannot be opened falls back
  // to a terminal prompt instead of timing out.
  explicit GuiConfirmer(bool terminalFallback = false)
      : terminalFallback_(terminalFallback) {}
  ~GuiConfirmer() override;

  GuiConfirmer(const GuiConfirmer &) = delete;
  GuiConfirmer &operator=(const GuiConfirmer &) = delete;

  std::optional<Choice> confirm(const ConfirmRequest &request,
                                std::chrono::milliseconds timeout) override;

private:
  bool init(int width, int height, const std::string &title);
  void shutdown();

  bool terminalFallback_;
  bool initialized_ = false;
  void *window_ = nullptr;
};

} // namespace solo

#endif // SOLO_GUI_HPP
