#include "solo/diagnostics.hpp"
#include "solo/classifier.hpp"
#include "solo/config.hpp"
#include "solo/errors.hpp"
#include "solo/identity_store.hpp"
#include "solo/liveness.hpp"
#include "solo/logger.hpp"
#include "solo/path_manager.hpp"
#include <filesystem>
#include <unistd.h>

namespace solo {

Diagnostics::Diagnostics(IdentityStore &store, LivenessProbe &probe,
                         BuildRecord current)
    : store_(store), probe_(probe), current_(std::move(current)) {}

int Diagnostics::failureCount() const {
  int count = 0;
  for (const auto &check : results_) {
    if (!check.second.ok)
      count++;
  }
  return count;
}

bool Diagnostics::fixIssue(const std::string &name,
                           std::function<void(float, std::string)> progressCb) {
  auto safeCb = progressCb ? progressCb : [](float, std::string) {};

  for (const auto &check : results_) {
    if (check.first == name && !check.second.ok && check.second.fixable &&
        check.second.fixAction) {
      check.second.fixAction(safeCb);
      return true;
    }
  }
  return false;
}

bool Diagnostics::runChecks() {
  results_.clear();
  process_.reset();
  build_.reset();
  buildMismatch_ = false;

  checkRoot();
  checkConfig();
  checkRecords();
  checkInstance();
  checkBuildMatch();
  checkLegacy();

  return failureCount() == 0;
}

// Clearing only happens while nobody alive owns the records.
std::function<void(std::function<void(float, std::string)>)>
Diagnostics::clearAction() {
  IdentityStore *store = &store_;
  LivenessProbe *probe = &probe_;
  return [store, probe](std::function<void(float, std::string)> cb) {
    cb(0.1f, "Clearing identity records...");
    auto held = store->lock(LockMode::Exclusive);
    auto snapshot = store->readIdentity();
    if (snapshot.process &&
        probe->isAlive(snapshot.process->pid,
                       snapshot.build ? snapshot.build->executablePath : "")) {
      cb(1.0f, "Skipped: pid " + std::to_string(snapshot.process->pid) +
                   " is alive");
      return;
    }
    store->clearIdentity();
    LOG_INFO("Identity records cleared by doctor");
    cb(1.0f, "Complete");
  };
}

void Diagnostics::checkRoot() {
  auto &pm = PathManager::instance();
  bool exists = std::filesystem::is_directory(pm.root());
  bool writable = exists && access(pm.root().c_str(), W_OK) == 0;
  std::string message = writable ? "Accessible"
                        : exists ? "Not writable"
                                 : "Missing";
  results_.push_back({"State Directory",
                      {writable,
                       message,
                       pm.root().string(),
                       !exists,
                       [](std::function<void(float, std::string)> cb) {
                         cb(0.1f, "Creating state directory...");
                         std::filesystem::create_directories(
                             PathManager::instance().root());
                         cb(1.0f, "Complete");
                       },
                       HealthCategory::CRITICAL,
                       {"filesystem", "core"}}});
}

void Diagnostics::checkConfig() {
  auto &cfg = Config::instance();
  std::filesystem::path path = PathManager::instance().config();
  bool present = std::filesystem::exists(path);
  bool ok = present && cfg.loadedCleanly();
  HealthStatus configStatus = {
      ok,
      !present ? "Missing" : (ok ? "Valid" : "Unreadable, using defaults"),
      path.string(),
      !ok,
      [](std::function<void(float, std::string)> cb) {
        cb(0.1f, "Regenerating Config...");
        Config::instance().save();
        cb(1.0f, "Complete");
      },
      HealthCategory::CONFIG,
      {"json", "settings"}};
  results_.push_back({"Configuration", configStatus});
}

void Diagnostics::checkRecords() {
  auto held = [this]() -> std::unique_ptr<StoreLock> {
    try {
      return store_.lock(LockMode::Shared);
    } catch (const PersistenceError &) {
      return nullptr;
    }
  }();

  HealthStatus processStatus{true, "Absent", store_.describe()};
  processStatus.category = HealthCategory::RECORDS;
  processStatus.tags = {"pid"};
  try {
    process_ = store_.readProcessRecord();
    if (process_) {
      processStatus.message = "Valid";
      processStatus.detail = "pid " + std::to_string(process_->pid) +
                             ", recorded " + isoTimestamp(process_->recordedAt);
    }
  } catch (const CorruptRecord &e) {
    processStatus.ok = false;
    processStatus.message = "Corrupt";
    processStatus.detail = e.what();
    processStatus.fixable = true;
    processStatus.fixAction = clearAction();
  }
  results_.push_back({"Process Record", processStatus});

  HealthStatus buildStatus{true, "Absent", store_.describe()};
  buildStatus.category = HealthCategory::RECORDS;
  buildStatus.tags = {"build", "json"};
  try {
    build_ = store_.readBuildRecord();
    if (build_) {
      buildStatus.message = "Valid";
      buildStatus.detail = build_->buildId + " (" + build_->version + ")";
      if (process_ && build_->pid != 0 && build_->pid != process_->pid) {
        buildMismatch_ = true;
        buildStatus.ok = false;
        buildStatus.message = "Written by another process";
        buildStatus.detail = "build record pid " + std::to_string(build_->pid) +
                             ", process record pid " +
                             std::to_string(process_->pid);
        buildStatus.fixable = true;
        buildStatus.fixAction = clearAction();
      }
    }
  } catch (const CorruptRecord &e) {
    buildStatus.ok = false;
    buildStatus.message = "Corrupt";
    buildStatus.detail = e.what();
    buildStatus.fixable = true;
    buildStatus.fixAction = clearAction();
  }
  results_.push_back({"Build Record", buildStatus});
}

void Diagnostics::checkInstance() {
  HealthStatus status{true, "None recorded", ""};
  status.category = HealthCategory::RECORDS;
  status.tags = {"process", "liveness"};

  if (process_) {
    std::string exe =
        (build_ && !buildMismatch_) ? build_->executablePath : "";
    bool alive = probe_.isAlive(process_->pid, exe);
    status.detail = "pid " + std::to_string(process_->pid);
    if (alive) {
      status.message = "Running";
    } else {
      status.ok = false;
      status.message = "Stale (process is gone)";
      status.fixable = true;
      status.fixAction = clearAction();
    }
  }
  results_.push_back({"Recorded Instance", status});
}

void Diagnostics::checkBuildMatch() {
  HealthStatus status{true, "Nothing to compare", current_.buildId};
  status.category = HealthCategory::RECORDS;
  status.tags = {"build", "informational"};

  if (build_ && !buildMismatch_) {
    if (build_->buildId == current_.buildId) {
      status.message = "Same build as this executable";
    } else {
      switch (compareAge(current_, *build_)) {
      case BuildAge::Older:
        status.message = "Recorded build is older";
        break;
      case BuildAge::Newer:
        status.message = "Recorded build is newer";
        break;
      default:
        status.message = "Recorded build differs";
        break;
      }
    }
    status.detail = "recorded " + build_->buildId + " (" + build_->version +
                    "), this " + current_.buildId + " (" + current_.version +
                    ")";
  }
  results_.push_back({"Build Match", status});
}

void Diagnostics::checkLegacy() {
  auto legacy = PathManager::instance().legacyRecords();
  std::string detail;
  for (const auto &p : legacy) {
    if (!detail.empty())
      detail += ", ";
    detail += p.string();
  }
  HealthStatus status = {
      legacy.empty(),
      legacy.empty() ? "None" : "Found in home directory",
      detail,
      !legacy.empty(),
      [this](std::function<void(float, std::string)> cb) {
        cb(0.1f, "Migrating legacy records...");
        bool published = store_.migrateLegacy(PathManager::legacyProcessRecord(),
                                              PathManager::legacyBuildRecord());
        cb(1.0f, published ? "Records moved into the state directory"
                           : "Legacy records removed");
      },
      HealthCategory::LEGACY,
      {"migration"}};
  results_.push_back({"Legacy Records", status});
}

} // namespace solo
