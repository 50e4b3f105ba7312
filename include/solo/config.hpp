#ifndef SOLO_CONFIG_HPP
#define SOLO_CONFIG_HPP

#include "solo/terminator.hpp"

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace solo {

struct ConfirmConfig {
  // auto | gui | terminal | keep | replace | abort
  std::string mode = "auto";
  int timeoutSeconds = 30;
};

struct TerminationConfig {
  int pollAttempts = 8;
  int initialIntervalMs = 100;
  double backoffFactor = 2.0;
  int maxIntervalMs = 2000;
  int killPollAttempts = 10;
  int killPollIntervalMs = 200;

  TerminationBudget budget() const;
};

struct LivenessConfig {
  bool verifyExecutable = true;
};

struct LogConfig {
  bool verbose = false;
};

namespace ConfirmModes {
inline const std::vector<std::string> All = {"auto", "gui",     "terminal",
                                             "keep", "replace", "abort"};
} // namespace ConfirmModes

class Config {
public:
  static Config &instance();

  void load(const std::filesystem::path &configPath);
  void save();

  // Restores defaults without touching the file.
  void reset();

  // Getters
  ConfirmConfig &getConfirm() { return confirm_; }
  TerminationConfig &getTermination() { return termination_; }
  LivenessConfig &getLiveness() { return liveness_; }
  LogConfig &getLog() { return log_; }

  // False when the last load found a file it could not parse.
  bool loadedCleanly() const { return loadedCleanly_; }
  std::filesystem::path path() const { return configPath_; }

  std::recursive_mutex &getMutex() { return mutex_; }

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  ConfirmConfig confirm_;
  TerminationConfig termination_;
  LivenessConfig liveness_;
  LogConfig log_;
  bool loadedCleanly_ = true;

  std::recursive_mutex mutex_;
};

} // namespace solo

#endif // SOLO_CONFIG_HPP
