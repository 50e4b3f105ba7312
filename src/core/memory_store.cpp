#include "solo/errors.hpp"
#include "solo/identity_store.hpp"

namespace solo {

namespace {

class MemoryGuard : public StoreLock {
public:
  explicit MemoryGuard(std::recursive_mutex &m) : lock_(m) {}

private:
  std::unique_lock<std::recursive_mutex> lock_;
};

} // namespace

std::optional<ProcessRecord> MemoryIdentityStore::readProcessRecord() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (corruptProcess_)
    throw CorruptRecord("memory:pid", "simulated corruption");
  return process_;
}

std::optional<BuildRecord> MemoryIdentityStore::readBuildRecord() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (corruptBuild_)
    throw CorruptRecord("memory:build", "simulated corruption");
  return build_;
}

void MemoryIdentityStore::writeIdentity(const ProcessRecord &process,
                                        const BuildRecord &build) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (failWrites_)
    throw PersistenceError("Failed to write identity (read-only store)");

  process_ = process;
  build_ = build;
  build_->pid = process.pid;
  build_->claimedAt = isoTimestamp(process.recordedAt);
  corruptProcess_ = false;
  corruptBuild_ = false;
  ++writeCount_;
}

void MemoryIdentityStore::clearIdentity() noexcept {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  process_.reset();
  build_.reset();
  corruptProcess_ = false;
  corruptBuild_ = false;
  ++clearCount_;
}

std::unique_ptr<StoreLock> MemoryIdentityStore::lock(LockMode) {
  return std::make_unique<MemoryGuard>(mutex_);
}

void MemoryIdentityStore::set(const std::optional<ProcessRecord> &process,
                              const std::optional<BuildRecord> &build) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  process_ = process;
  build_ = build;
}

std::optional<ProcessRecord> MemoryIdentityStore::process() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return process_;
}

std::optional<BuildRecord> MemoryIdentityStore::build() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return build_;
}

} // namespace solo
