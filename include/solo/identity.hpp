#ifndef SOLO_IDENTITY_HPP
#define SOLO_IDENTITY_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace solo {

struct ProcessRecord {
  int pid = 0;
  std::chrono::system_clock::time_point recordedAt;
};

struct BuildRecord {
  std::string buildId;
  std::string version;
  std::string executablePath;

  // Build time, informational. Empty / 0 when unknown.
  std::string timestamp;
  std::int64_t unixTimestamp = 0;

  // Writer of this record, set on claim. 0 when unknown.
  int pid = 0;
  std::string claimedAt;
};

// Last-recorded identity as seen by one read of the store.
struct IdentitySnapshot {
  std::optional<ProcessRecord> process;
  std::optional<BuildRecord> build;
};

bool sameClaim(const IdentitySnapshot &a, const IdentitySnapshot &b);

// pid record text: a single positive decimal integer.
std::string formatProcessRecord(const ProcessRecord &record);
ProcessRecord parseProcessRecord(const std::string &text,
                                 const std::string &origin);

nlohmann::json buildRecordToJson(const BuildRecord &record);
BuildRecord buildRecordFromJson(const nlohmann::json &j,
                                const std::string &origin);
BuildRecord parseBuildRecord(const std::string &text,
                             const std::string &origin);

// True for MAJOR.MINOR.PATCH with decimal components.
bool isSemanticVersion(const std::string &version);

std::string isoTimestamp(std::chrono::system_clock::time_point tp);

} // namespace solo

#endif // SOLO_IDENTITY_HPP
