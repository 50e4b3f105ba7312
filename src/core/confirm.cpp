#include "solo/confirm.hpp"
#include "solo/logger.hpp"
#include "solo/signals.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <poll.h>
#include <sstream>
#include <unistd.h>

namespace solo {

std::optional<Choice> FixedConfirmer::confirm(const ConfirmRequest &request,
                                              std::chrono::milliseconds) {
  LOG_INFO("Non-interactive answer '" + toString(choice_) +
           "' for: " + request.message);
  return choice_;
}

std::optional<Choice> parseChoice(const std::string &name) {
  if (name == "replace")
    return Choice::Replace;
  if (name == "keep")
    return Choice::KeepExisting;
  if (name == "abort")
    return Choice::Abort;
  return std::nullopt;
}

std::optional<Choice> TerminalConfirmer::parseAnswer(const std::string &line) {
  std::string word;
  for (char c : line) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (word == "r")
    return Choice::Replace;
  if (word == "k")
    return Choice::KeepExisting;
  if (word == "a")
    return Choice::Abort;
  return parseChoice(word);
}

std::string formatRequest(const ConfirmRequest &request) {
  std::ostringstream ss;
  ss << request.message << "\n\n"
     << "  Running:  version " << request.priorVersion << "  build "
     << request.priorBuildId << "  (pid " << request.priorPid << ")\n"
     << "  Starting: version " << request.currentVersion << "  build "
     << request.currentBuildId << "\n";
  return ss.str();
}

void TerminalConfirmer::print(const std::string &text) {
  size_t done = 0;
  while (done < text.size()) {
    ssize_t n = write(outputFd_, text.data() + done, text.size() - done);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return;
    }
    done += static_cast<size_t>(n);
  }
}

std::optional<Choice>
TerminalConfirmer::confirm(const ConfirmRequest &request,
                           std::chrono::milliseconds timeout) {
  print("\n" + formatRequest(request) +
        "\n[r]eplace running instance, [k]eep it, [a]bort launch (" +
        std::to_string(timeout.count() / 1000) + "s): ");

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string line;

  while (true) {
    if (ShutdownSignal::requested())
      return Choice::Abort;

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      print("\nNo answer, keeping the running instance.\n");
      return std::nullopt;
    }

    struct pollfd pfd = {inputFd_, POLLIN, 0};
    int rc = poll(&pfd, 1,
                  static_cast<int>(std::min<long long>(left.count(), 250)));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      LOG_WARN("poll on confirmation input failed");
      return std::nullopt;
    }
    if (rc == 0)
      continue;

    char c;
    ssize_t n = read(inputFd_, &c, 1);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      // EOF: nobody will answer
      return std::nullopt;
    }
    if (c != '\n') {
      line += c;
      continue;
    }

    auto answer = parseAnswer(line);
    if (answer)
      return answer;
    line.clear();
    print("Please answer r, k or a: ");
  }
}

} // namespace solo
