#include "solo/config.hpp"
#include "solo/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace solo {

using json = nlohmann::json;

namespace {

// Keeps the worst case of a replace at 15 x 2 s graceful plus 10 x 0.5 s
// forced, whatever the file says.
constexpr int kMaxPollAttempts = 15;
constexpr int kMaxIntervalMs = 2000;
constexpr double kMaxBackoffFactor = 4.0;
constexpr int kMaxKillPollAttempts = 10;
constexpr int kMaxKillPollIntervalMs = 500;

} // namespace

TerminationBudget TerminationConfig::budget() const {
  TerminationBudget b;
  int maxMs = std::clamp(maxIntervalMs, 1, kMaxIntervalMs);
  b.pollAttempts = std::clamp(pollAttempts, 1, kMaxPollAttempts);
  b.initialInterval =
      std::chrono::milliseconds(std::clamp(initialIntervalMs, 1, maxMs));
  b.backoffFactor = std::clamp(backoffFactor, 1.0, kMaxBackoffFactor);
  b.maxInterval = std::chrono::milliseconds(maxMs);
  b.killPollAttempts = std::clamp(killPollAttempts, 1, kMaxKillPollAttempts);
  b.killPollInterval = std::chrono::milliseconds(
      std::clamp(killPollIntervalMs, 1, kMaxKillPollIntervalMs));
  return b;
}

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::reset() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  confirm_ = ConfirmConfig{};
  termination_ = TerminationConfig{};
  liveness_ = LivenessConfig{};
  log_ = LogConfig{};
  loadedCleanly_ = true;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  reset();
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_INFO("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;

    if (j.contains("confirm")) {
      auto &c = j["confirm"];
      confirm_.mode = c.value("mode", "auto");
      if (std::find(ConfirmModes::All.begin(), ConfirmModes::All.end(),
                    confirm_.mode) == ConfirmModes::All.end()) {
        LOG_WARN("Unknown confirm.mode '" + confirm_.mode +
                 "', falling back to auto");
        confirm_.mode = "auto";
      }
      confirm_.timeoutSeconds = std::max(1, c.value("timeout_seconds", 30));
    }

    if (j.contains("termination")) {
      auto &t = j["termination"];
      termination_.pollAttempts = t.value("poll_attempts", 8);
      termination_.initialIntervalMs = t.value("initial_interval_ms", 100);
      termination_.backoffFactor = t.value("backoff_factor", 2.0);
      termination_.maxIntervalMs = t.value("max_interval_ms", 2000);
      termination_.killPollAttempts = t.value("kill_poll_attempts", 10);
      termination_.killPollIntervalMs = t.value("kill_poll_interval_ms", 200);
    }

    if (j.contains("liveness")) {
      liveness_.verifyExecutable =
          j["liveness"].value("verify_executable", true);
    }

    if (j.contains("log")) {
      log_.verbose = j["log"].value("verbose", false);
    }

    LOG_INFO("Configuration loaded from " + path.string());
    save();

  } catch (const std::exception &e) {
    // keep the file for the user to repair; run on defaults
    reset();
    loadedCleanly_ = false;
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
  }
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
  }

  json j;
  j["confirm"] = {{"mode", confirm_.mode},
                  {"timeout_seconds", confirm_.timeoutSeconds}};
  j["termination"] = {
      {"poll_attempts", termination_.pollAttempts},
      {"initial_interval_ms", termination_.initialIntervalMs},
      {"backoff_factor", termination_.backoffFactor},
      {"max_interval_ms", termination_.maxIntervalMs},
      {"kill_poll_attempts", termination_.killPollAttempts},
      {"kill_poll_interval_ms", termination_.killPollIntervalMs}};
  j["liveness"]["verify_executable"] = liveness_.verifyExecutable;
  j["log"]["verbose"] = log_.verbose;

  std::ofstream file(configPath_);
  if (!file) {
    LOG_WARN("Failed to write config file " + configPath_.string());
    return;
  }
  file << j.dump(4);
  LOG_DEBUG("Configuration saved to " + configPath_.string());
}

} // namespace solo
