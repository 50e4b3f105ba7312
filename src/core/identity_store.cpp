#include "solo/identity_store.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace solo {

namespace {

struct FileContent {
  std::string data;
  std::chrono::system_clock::time_point mtime;
};

std::chrono::system_clock::time_point toTimePoint(const struct timespec &ts) {
  auto d = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(d));
}

struct timespec toTimespec(std::chrono::system_clock::time_point tp) {
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                tp.time_since_epoch())
                .count();
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ns / 1000000000);
  ts.tv_nsec = static_cast<long>(ns % 1000000000);
  return ts;
}

// Reads a whole record file. nullopt when it does not exist.
std::optional<FileContent> slurp(const std::filesystem::path &path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    if (errno == ENOENT || errno == ENOTDIR)
      return std::nullopt;
    throw CorruptRecord(path.string(),
                        std::string("unreadable (") + strerror(errno) + ")");
  }

  FileContent content;
  struct stat st;
  if (fstat(fd, &st) == 0)
    content.mtime = toTimePoint(st.st_mtim);

  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n == 0)
      break;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      close(fd);
      throw CorruptRecord(path.string(),
                          std::string("read failed (") + strerror(err) + ")");
    }
    content.data.append(buf, static_cast<size_t>(n));
    if (content.data.size() > 64 * 1024) {
      close(fd);
      throw CorruptRecord(path.string(), "record is implausibly large");
    }
  }
  close(fd);
  return content;
}

void syncDirectory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd == -1)
    return;
  fsync(fd);
  close(fd);
}

int flockRetry(int fd, int op) {
  int rc;
  do {
    rc = flock(fd, op);
  } while (rc == -1 && errno == EINTR);
  return rc;
}

} // namespace

IdentitySnapshot IdentityStore::readIdentity(std::vector<std::string> *warnings) {
  auto warn = [warnings](const std::string &msg) {
    LOG_WARN(msg);
    if (warnings)
      warnings->push_back(msg);
  };

  std::unique_ptr<StoreLock> held;
  try {
    held = lock(LockMode::Shared);
  } catch (const PersistenceError &e) {
    LOG_DEBUG(std::string("Reading identity without lock: ") + e.what());
  }

  IdentitySnapshot snapshot;
  try {
    snapshot.process = readProcessRecord();
  } catch (const CorruptRecord &e) {
    warn(std::string(e.what()) + "; treating as absent");
  }
  try {
    snapshot.build = readBuildRecord();
  } catch (const CorruptRecord &e) {
    warn(std::string(e.what()) + "; treating as absent");
  }

  if (snapshot.process && snapshot.build && snapshot.build->pid != 0 &&
      snapshot.build->pid != snapshot.process->pid) {
    warn("build record was written by pid " +
         std::to_string(snapshot.build->pid) + " but process record names " +
         std::to_string(snapshot.process->pid) + "; ignoring build record");
    snapshot.build.reset();
  }
  return snapshot;
}

bool IdentityStore::migrateLegacy(
    const std::filesystem::path &legacyProcess,
    const std::filesystem::path &legacyBuild) noexcept {
  std::error_code ec;
  bool haveProcess =
      !legacyProcess.empty() && std::filesystem::exists(legacyProcess, ec);
  bool haveBuild =
      !legacyBuild.empty() && std::filesystem::exists(legacyBuild, ec);
  if (!haveProcess && !haveBuild)
    return false;

  bool published = false;
  try {
    auto held = lock(LockMode::Exclusive);

    std::optional<ProcessRecord> process;
    std::optional<BuildRecord> build;
    try {
      if (auto content = slurp(legacyProcess)) {
        process = parseProcessRecord(content->data, legacyProcess.string());
        process->recordedAt = content->mtime;
      }
      if (auto content = slurp(legacyBuild))
        build = parseBuildRecord(content->data, legacyBuild.string());
    } catch (const CorruptRecord &e) {
      LOG_WARN(std::string("Legacy record unusable: ") + e.what());
      process.reset();
      build.reset();
    }

    if (!process || !build) {
      LOG_WARN("Legacy records are incomplete; discarding them");
    } else if (readIdentity().process) {
      LOG_INFO("Legacy records superseded by " + describe());
    } else {
      writeIdentity(*process, *build);
      published = true;
      LOG_INFO("Migrated legacy records of pid " +
               std::to_string(process->pid) + " into " + describe());
    }

    std::filesystem::remove(legacyProcess, ec);
    std::filesystem::remove(legacyBuild, ec);
  } catch (const std::exception &e) {
    // Legacy files stay in place for the next attempt.
    LOG_WARN(std::string("Failed to migrate legacy records: ") + e.what());
    return false;
  }
  return published;
}

class FileIdentityStore::Guard : public StoreLock {
public:
  Guard(FileIdentityStore *store, LockMode previous)
      : store_(store), previous_(previous) {}
  ~Guard() override { store_->release(previous_); }

private:
  FileIdentityStore *store_;
  LockMode previous_;
};

FileIdentityStore::FileIdentityStore(const std::filesystem::path &stateDir)
    : dir_(stateDir), pidPath_(stateDir / "solo.pid"),
      buildPath_(stateDir / "solo.build"), lockPath_(stateDir / "solo.lock") {}

FileIdentityStore::~FileIdentityStore() {
  if (lockFd_ != -1) {
    flock(lockFd_, LOCK_UN);
    close(lockFd_);
    lockFd_ = -1;
  }
}

void FileIdentityStore::openLockFile() {
  if (lockFd_ != -1)
    return;

  lockFd_ = open(lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (lockFd_ == -1 && (errno == EROFS || errno == EACCES)) {
    // flock works on read-only descriptors too
    lockFd_ = open(lockPath_.c_str(), O_RDONLY | O_CLOEXEC);
  }
  if (lockFd_ == -1) {
    throw PersistenceError("Failed to open lock file: " + lockPath_.string() +
                           " (" + strerror(errno) + ")");
  }
}

std::unique_ptr<StoreLock> FileIdentityStore::lock(LockMode mode) {
  if (lockDepth_ > 0) {
    LockMode previous = heldMode_;
    if (mode == LockMode::Exclusive && heldMode_ == LockMode::Shared) {
      if (flockRetry(lockFd_, LOCK_EX) == -1)
        throw PersistenceError("Failed to upgrade lock: " +
                               std::string(strerror(errno)));
      heldMode_ = LockMode::Exclusive;
    }
    ++lockDepth_;
    return std::make_unique<Guard>(this, previous);
  }

  if (mode == LockMode::Exclusive) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec)
      throw PersistenceError("Failed to create state directory " +
                             dir_.string() + ": " + ec.message());
  }

  openLockFile();
  if (flockRetry(lockFd_, mode == LockMode::Exclusive ? LOCK_EX : LOCK_SH) ==
      -1) {
    throw PersistenceError("Failed to flock " + lockPath_.string() + ": " +
                           strerror(errno));
  }
  heldMode_ = mode;
  lockDepth_ = 1;
  return std::make_unique<Guard>(this, mode);
}

void FileIdentityStore::release(LockMode previous) {
  if (lockDepth_ == 0 || lockFd_ == -1)
    return;

  if (--lockDepth_ == 0) {
    flock(lockFd_, LOCK_UN);
    return;
  }
  if (heldMode_ != previous) {
    flockRetry(lockFd_, LOCK_SH);
    heldMode_ = previous;
  }
}

std::optional<ProcessRecord> FileIdentityStore::readProcessRecord() {
  auto content = slurp(pidPath_);
  if (!content)
    return std::nullopt;

  ProcessRecord record = parseProcessRecord(content->data, pidPath_.string());
  record.recordedAt = content->mtime;
  return record;
}

std::optional<BuildRecord> FileIdentityStore::readBuildRecord() {
  auto content = slurp(buildPath_);
  if (!content)
    return std::nullopt;
  return parseBuildRecord(content->data, buildPath_.string());
}

void FileIdentityStore::writeAtomic(const std::filesystem::path &target,
                                    const std::string &content,
                                    std::chrono::system_clock::time_point mtime) {
  std::string tmp = target.string() + ".tmp." + std::to_string(getpid());

  auto fail = [&](const std::string &what, int err) {
    unlink(tmp.c_str());
    throw PersistenceError("Failed to " + what + " " + target.string() + " (" +
                           strerror(err) + ")");
  };

  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd == -1)
    fail("create temporary file for", errno);

  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      close(fd);
      fail("write", err);
    }
    written += static_cast<size_t>(n);
  }

  struct timespec times[2] = {toTimespec(mtime), toTimespec(mtime)};
  futimens(fd, times);

  if (fsync(fd) == -1) {
    int err = errno;
    close(fd);
    fail("sync", err);
  }
  if (close(fd) == -1)
    fail("close", errno);

  if (rename(tmp.c_str(), target.c_str()) == -1)
    fail("replace", errno);
}

void FileIdentityStore::writeIdentity(const ProcessRecord &process,
                                      const BuildRecord &build) {
  auto held = lock(LockMode::Exclusive);

  BuildRecord stamped = build;
  stamped.pid = process.pid;
  stamped.claimedAt = isoTimestamp(process.recordedAt);

  // Paths are bytes, not UTF-8. Invalid sequences become U+FFFD.
  std::string buildText;
  try {
    buildText = buildRecordToJson(stamped).dump(
                    2, ' ', false, nlohmann::json::error_handler_t::replace) +
                "\n";
  } catch (const nlohmann::json::exception &e) {
    throw PersistenceError("Failed to encode " + buildPath_.string() + ": " +
                           e.what());
  }

  // The pid record is the commit point, so it goes last.
  writeAtomic(buildPath_, buildText, process.recordedAt);
  writeAtomic(pidPath_, formatProcessRecord(process), process.recordedAt);
  syncDirectory(dir_);
}

void FileIdentityStore::clearIdentity() noexcept {
  std::error_code ec;
  if (!std::filesystem::exists(dir_, ec))
    return;

  std::unique_ptr<StoreLock> held;
  try {
    held = lock(LockMode::Exclusive);
  } catch (const std::exception &) {
    // removal below is still worth attempting
  }

  std::filesystem::remove(pidPath_, ec);
  std::filesystem::remove(buildPath_, ec);

  // Temp files of interrupted writers. Only safe while no writer can run.
  if (!held)
    return;
  const std::string pidTmp = pidPath_.filename().string() + ".tmp.";
  const std::string buildTmp = buildPath_.filename().string() + ".tmp.";
  for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (name.rfind(pidTmp, 0) == 0 || name.rfind(buildTmp, 0) == 0) {
      std::error_code rmEc;
      std::filesystem::remove(it->path(), rmEc);
    }
  }
}

} // namespace solo
