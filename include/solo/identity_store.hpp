#ifndef SOLO_IDENTITY_STORE_HPP
#define SOLO_IDENTITY_STORE_HPP

#include "solo/identity.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace solo {

enum class LockMode { Shared, Exclusive };

// Held for the lifetime of the object. Releasing happens in the destructor.
class StoreLock {
public:
  virtual ~StoreLock() = default;
};

class IdentityStore {
public:
  virtual ~IdentityStore() = default;

  // Throw CorruptRecord when the persisted bytes cannot be parsed.
  virtual std::optional<ProcessRecord> readProcessRecord() = 0;
  virtual std::optional<BuildRecord> readBuildRecord() = 0;

  // Writes both records so that no reader observes a partial update.
  // Throws PersistenceError on I/O failure.
  virtual void writeIdentity(const ProcessRecord &process,
                             const BuildRecord &build) = 0;

  // Best-effort removal of both records. Never throws.
  virtual void clearIdentity() noexcept = 0;

  // Serializes pair reads (Shared) and claims (Exclusive) between
  // processes. Nested requests from the same store reuse the held lock.
  virtual std::unique_ptr<StoreLock> lock(LockMode mode) = 0;

  virtual std::string describe() const = 0;

  // Reads both records under a shared lock. Corrupt records come back
  // absent; the reason is logged and appended to warnings when given.
  IdentitySnapshot readIdentity(std::vector<std::string> *warnings = nullptr);

  // Adopts a record pair left by the old dotfile layout. The pair is
  // published through writeIdentity only when both files parse and no
  // process record exists yet; the legacy files are removed either way.
  // Returns true when a pair was published. Never throws.
  bool migrateLegacy(const std::filesystem::path &legacyProcess,
                     const std::filesystem::path &legacyBuild) noexcept;
};

class FileIdentityStore : public IdentityStore {
public:
  explicit FileIdentityStore(const std::filesystem::path &stateDir);
  ~FileIdentityStore() override;

  std::optional<ProcessRecord> readProcessRecord() override;
  std::optional<BuildRecord> readBuildRecord() override;
  void writeIdentity(const ProcessRecord &process,
                     const BuildRecord &build) override;
  void clearIdentity() noexcept override;
  std::unique_ptr<StoreLock> lock(LockMode mode) override;
  std::string describe() const override { return dir_.string(); }

  std::filesystem::path processRecordPath() const { return pidPath_; }
  std::filesystem::path buildRecordPath() const { return buildPath_; }
  std::filesystem::path lockPath() const { return lockPath_; }

  FileIdentityStore(const FileIdentityStore &) = delete;
  FileIdentityStore &operator=(const FileIdentityStore &) = delete;

private:
  class Guard;

  std::filesystem::path dir_;
  std::filesystem::path pidPath_;
  std::filesystem::path buildPath_;
  std::filesystem::path lockPath_;

  int lockFd_ = -1;
  int lockDepth_ = 0;
  LockMode heldMode_ = LockMode::Shared;

  void openLockFile();
  void release(LockMode previous);
  void writeAtomic(const std::filesystem::path &target,
                   const std::string &content,
                   std::chrono::system_clock::time_point mtime);
};

// Process-local store. Tests use it to drive the coordinator without
// touching the filesystem; methods are virtual so a test can interleave a
// competing writer.
class MemoryIdentityStore : public IdentityStore {
public:
  std::optional<ProcessRecord> readProcessRecord() override;
  std::optional<BuildRecord> readBuildRecord() override;
  void writeIdentity(const ProcessRecord &process,
                     const BuildRecord &build) override;
  void clearIdentity() noexcept override;
  std::unique_ptr<StoreLock> lock(LockMode mode) override;
  std::string describe() const override { return "memory"; }

  // Direct access for test setup.
  void set(const std::optional<ProcessRecord> &process,
           const std::optional<BuildRecord> &build);
  void setCorruptProcessRecord(bool corrupt) { corruptProcess_ = corrupt; }
  void setCorruptBuildRecord(bool corrupt) { corruptBuild_ = corrupt; }
  void setFailWrites(bool fail) { failWrites_ = fail; }

  std::optional<ProcessRecord> process() const;
  std::optional<BuildRecord> build() const;
  int writeCount() const { return writeCount_; }
  int clearCount() const { return clearCount_; }

protected:
  mutable std::recursive_mutex mutex_;
  std::optional<ProcessRecord> process_;
  std::optional<BuildRecord> build_;
  bool corruptProcess_ = false;
  bool corruptBuild_ = false;
  bool failWrites_ = false;
  int writeCount_ = 0;
  int clearCount_ = 0;
};

} // namespace solo

#endif // SOLO_IDENTITY_STORE_HPP
