#include "solo/build_info.hpp"
#include "solo/classifier.hpp"
#include "solo/config.hpp"
#include "solo/confirm.hpp"
#include "solo/coordinator.hpp"
#include "solo/diagnostics.hpp"
#include "solo/identity_store.hpp"
#include "solo/liveness.hpp"
#include "solo/logger.hpp"
#include "solo/path_manager.hpp"
#include "solo/process.hpp"
#include "solo/signals.hpp"
#include "solo/terminator.hpp"
#include "solo/version.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

void showHelp() {
  std::cout
      << "solo - keep one instance of this program running\n\n"
      << "Usage: solo [command] [flags...]\n\n"
      << "Commands:\n"
      << "  run        Reconcile with any running instance, then stay "
         "resident (Default)\n"
      << "  status     Show the recorded instance and how it compares\n"
      << "  doctor     Run health checks on the state directory\n"
      << "             (--fix repairs stale or corrupt records)\n"
      << "  clear      Remove the records if their owner is not running\n"
      << "  help       Show this help message\n\n"
      << "Flags:\n"
      << "  -v, --verbose             Enable verbose logging to stdout\n"
      << "  --root <dir>              Use <dir> as the state directory\n"
      << "  --on-conflict <choice>    Answer conflicts with keep, replace or "
         "abort\n"
      << "  --timeout <seconds>       How long to wait for an answer\n"
      << "  --version                 Print the version and build id\n";
}

namespace {

struct Options {
  std::string command = "run";
  bool verbose = false;
  bool fix = false;
  std::string root;
  std::string onConflict;
  int timeoutSeconds = 0;
};

// Returns false on a usage error.
bool parseArgs(const std::vector<std::string> &args, Options &opts,
               std::string &error) {
  bool haveCommand = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    auto next = [&](std::string &out) {
      if (i + 1 >= args.size()) {
        error = arg + " needs a value";
        return false;
      }
      out = args[++i];
      return true;
    };

    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--fix") {
      opts.fix = true;
    } else if (arg == "--root") {
      if (!next(opts.root))
        return false;
    } else if (arg == "--on-conflict") {
      if (!next(opts.onConflict))
        return false;
      if (!solo::parseChoice(opts.onConflict)) {
        error = "--on-conflict expects keep, replace or abort";
        return false;
      }
    } else if (arg == "--timeout") {
      std::string value;
      if (!next(value))
        return false;
      try {
        opts.timeoutSeconds = std::stoi(value);
      } catch (const std::exception &) {
        error = "--timeout expects a number of seconds";
        return false;
      }
      if (opts.timeoutSeconds < 1) {
        error = "--timeout must be at least 1";
        return false;
      }
    } else if (!haveCommand && !arg.empty() && arg[0] != '-') {
      opts.command = arg;
      haveCommand = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

std::string describeRecordAge(std::chrono::system_clock::time_point t) {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                  std::chrono::system_clock::now() - t)
                  .count();
  if (secs < 0)
    secs = 0;
  return solo::isoTimestamp(t) + " (" + std::to_string(secs) + "s ago)";
}

int cmdRun(const Options &opts, solo::FileIdentityStore &store) {
  auto &cfg = solo::Config::instance();

  std::string mode =
      opts.onConflict.empty() ? cfg.getConfirm().mode : opts.onConflict;
  int timeoutSeconds = opts.timeoutSeconds > 0 ? opts.timeoutSeconds
                                               : cfg.getConfirm().timeoutSeconds;

  // Installed before asking so Ctrl-C during the prompt cancels the launch.
  solo::ShutdownSignal::install();

  solo::SystemLivenessProbe probe(cfg.getLiveness().verifyExecutable);
  solo::SystemProcessControl control;
  auto confirmer = solo::makeConfirmer(mode);

  solo::CoordinatorOptions options;
  options.confirmTimeout = std::chrono::seconds(timeoutSeconds);
  options.termination = cfg.getTermination().budget();

  solo::InstanceCoordinator coordinator(store, probe, *confirmer, control,
                                        options);
  solo::StartupOutcome outcome =
      coordinator.startup(solo::BuildInfo::current());

  for (const auto &warning : outcome.warnings)
    std::cerr << "[solo] Warning: " << warning << "\n";

  if (outcome.decision == solo::Decision::Exit) {
    std::cout << "[solo] Another instance is already running. Exiting.\n";
    return 0;
  }

  if (!outcome.enforcementReliable) {
    std::cerr << "[solo] Single-instance enforcement is unreliable for this "
                 "run.\n";
  }

  LOG_INFO("Running as pid " + std::to_string(coordinator.selfPid()) +
           ", build " + solo::BuildInfo::current().buildId);
  std::cout << "[solo] Running (pid " << coordinator.selfPid()
            << "). Press Ctrl-C to stop.\n";

  while (!solo::ShutdownSignal::requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    if (outcome.claimed && !coordinator.ownsIdentity()) {
      LOG_WARN("Identity record no longer names this process; stopping");
      break;
    }
  }

  if (solo::ShutdownSignal::requested()) {
    LOG_INFO("Shutdown requested (signal " +
             std::to_string(solo::ShutdownSignal::lastSignal()) + ")");
  }
  coordinator.shutdown();
  return 0;
}

int cmdStatus(solo::FileIdentityStore &store) {
  auto &cfg = solo::Config::instance();
  solo::SystemLivenessProbe probe(cfg.getLiveness().verifyExecutable);
  const solo::BuildRecord &current = solo::BuildInfo::current();

  std::vector<std::string> warnings;
  solo::IdentitySnapshot snapshot = store.readIdentity(&warnings);

  std::cout << "State directory: " << store.describe() << "\n";
  std::cout << "This build:      " << current.buildId << " ("
            << current.version << ")\n";
  for (const auto &w : warnings)
    std::cout << "Warning:         " << w << "\n";

  if (!snapshot.process) {
    std::cout << "Recorded:        none\n";
  } else {
    std::string exe = snapshot.build ? snapshot.build->executablePath : "";
    bool alive = probe.isAlive(snapshot.process->pid, exe);
    std::cout << "Recorded pid:    " << snapshot.process->pid
              << (alive ? " (running)" : " (not running)") << "\n";
    std::cout << "Recorded at:     "
              << describeRecordAge(snapshot.process->recordedAt) << "\n";
    if (snapshot.build) {
      std::cout << "Recorded build:  " << snapshot.build->buildId << " ("
                << snapshot.build->version << ")\n";
      std::cout << "Executable:      " << snapshot.build->executablePath
                << "\n";
    }

    solo::Classification c =
        solo::classify(current, snapshot.process, snapshot.build, alive);
    std::cout << "Classification:  " << solo::toString(c) << "\n";
    if (c == solo::Classification::LiveSameBuild ||
        c == solo::Classification::LiveDifferentBuild) {
      std::cout << "                 "
                << solo::describeCollision(c, current, snapshot.build) << "\n";
    }
  }

  if (!current.executablePath.empty()) {
    auto running = solo::Process::findByExe(current.executablePath);
    int self = solo::Process::currentPid();
    running.erase(std::remove_if(running.begin(), running.end(),
                                 [self](const solo::ProcessInfo &p) {
                                   return p.pid == self;
                                 }),
                  running.end());
    if (!running.empty()) {
      std::cout << "Other processes of this executable:";
      for (const auto &p : running)
        std::cout << " " << p.pid;
      std::cout << "\n";
    }
  }
  return 0;
}

void printResults(const solo::Diagnostics &diag) {
  for (const auto &res : diag.getResults()) {
    const auto &s = res.second;
    std::cout << (s.ok ? "[ OK ] " : "[FAIL] ") << res.first << ": "
              << s.message;
    if (!s.detail.empty())
      std::cout << " - " << s.detail;
    if (!s.ok && s.fixable)
      std::cout << " (fixable)";
    std::cout << "\n";
  }
}

int cmdDoctor(const Options &opts, solo::FileIdentityStore &store) {
  auto &cfg = solo::Config::instance();
  solo::SystemLivenessProbe probe(cfg.getLiveness().verifyExecutable);
  solo::Diagnostics diag(store, probe, solo::BuildInfo::current());

  bool healthy = diag.runChecks();
  printResults(diag);
  if (healthy || !opts.fix)
    return healthy ? 0 : 1;

  auto results = diag.getResults();
  for (const auto &res : results) {
    if (res.second.ok || !res.second.fixable)
      continue;
    diag.fixIssue(res.first, [&](float p, std::string msg) {
      if (p >= 1.0f)
        std::cout << "Fixing " << res.first << ": " << msg << "\n";
    });
  }

  std::cout << "\nAfter fixes:\n";
  healthy = diag.runChecks();
  printResults(diag);
  return healthy ? 0 : 1;
}

int cmdClear(solo::FileIdentityStore &store) {
  auto &cfg = solo::Config::instance();
  solo::SystemLivenessProbe probe(cfg.getLiveness().verifyExecutable);

  auto held = store.lock(solo::LockMode::Exclusive);
  solo::IdentitySnapshot snapshot = store.readIdentity();
  if (snapshot.process) {
    std::string exe = snapshot.build ? snapshot.build->executablePath : "";
    if (probe.isAlive(snapshot.process->pid, exe)) {
      std::cout << "[solo] pid " << snapshot.process->pid
                << " is still running; records left in place.\n";
      return 1;
    }
  }
  store.clearIdentity();
  LOG_INFO("Identity records cleared");
  std::cout << "[solo] Records cleared.\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty()) {
      args.push_back(arg);
    }
  }

  if (!args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return 0;
  }

  if (!args.empty() && args[0] == "--version") {
    std::cout << "solo v" << solo::SOLO_VERSION_STRING << " ("
              << solo::BuildInfo::compiled().buildId << ")\n";
    return 0;
  }

  Options opts;
  std::string error;
  if (!parseArgs(args, opts, error)) {
    std::cerr << "[solo] " << error << "\n\n";
    showHelp();
    return 1;
  }

  try {
    solo::PathManager::instance().init(opts.root);
    auto &pathMgr = solo::PathManager::instance();

    solo::Logger::instance().init(pathMgr.currentLog(), opts.verbose);
    LOG_INFO("=== solo v" + solo::SOLO_VERSION_STRING +
             " started. Command: " + opts.command + " ===");

    auto &cfg = solo::Config::instance();
    cfg.load(pathMgr.config());
    if (cfg.getLog().verbose)
      solo::Logger::instance().setVerbose(true);

    solo::FileIdentityStore store(pathMgr.root());

    if (opts.command == "run") {
      store.migrateLegacy(pathMgr.legacyProcessRecord(),
                          pathMgr.legacyBuildRecord());
      return cmdRun(opts, store);
    }
    if (opts.command == "status")
      return cmdStatus(store);
    if (opts.command == "doctor")
      return cmdDoctor(opts, store);
    if (opts.command == "clear")
      return cmdClear(store);
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("Unexpected error: ") + e.what());
    return 1;
  }

  std::cerr << "[solo] Unknown command: " << opts.command << "\n\n";
  showHelp();
  return 1;
}
