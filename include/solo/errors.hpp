#ifndef SOLO_ERRORS_HPP
#define SOLO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace solo {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Persisted record bytes could not be parsed. Callers treat it as absent.
class CorruptRecord : public Error {
public:
  CorruptRecord(const std::string &path, const std::string &reason)
      : Error("corrupt record " + path + ": " + reason), path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

// Identity could not be written. Single-instance enforcement is unreliable
// for this launch.
class PersistenceError : public Error {
public:
  using Error::Error;
};

// Prior process survived graceful and forced termination.
class TerminationTimeout : public Error {
public:
  explicit TerminationTimeout(int pid)
      : Error("process " + std::to_string(pid) +
              " did not exit after forced termination"),
        pid_(pid) {}

  int pid() const { return pid_; }

private:
  int pid_;
};

// Identity changed between classification and claim.
class RaceDetected : public Error {
public:
  using Error::Error;
};

} // namespace solo

#endif // SOLO_ERRORS_HPP
