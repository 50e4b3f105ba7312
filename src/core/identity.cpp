#include "solo/identity.hpp"
#include "solo/errors.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace solo {

using json = nlohmann::json;

bool sameClaim(const IdentitySnapshot &a, const IdentitySnapshot &b) {
  if (a.process.has_value() != b.process.has_value())
    return false;
  if (a.process && (a.process->pid != b.process->pid ||
                    a.process->recordedAt != b.process->recordedAt))
    return false;

  if (a.build.has_value() != b.build.has_value())
    return false;
  if (a.build && (a.build->buildId != b.build->buildId ||
                  a.build->pid != b.build->pid ||
                  a.build->claimedAt != b.build->claimedAt))
    return false;

  return true;
}

std::string formatProcessRecord(const ProcessRecord &record) {
  return std::to_string(record.pid) + "\n";
}

ProcessRecord parseProcessRecord(const std::string &text,
                                 const std::string &origin) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;

  if (begin == end)
    throw CorruptRecord(origin, "empty pid record");

  std::string digits = text.substr(begin, end - begin);
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      throw CorruptRecord(origin, "not a decimal pid: '" + digits + "'");
  }
  if (digits.size() > 9)
    throw CorruptRecord(origin, "pid out of range: " + digits);

  ProcessRecord record;
  record.pid = std::stoi(digits);
  if (record.pid <= 0)
    throw CorruptRecord(origin, "pid must be positive");
  return record;
}

json buildRecordToJson(const BuildRecord &record) {
  json j = {{"build_id", record.buildId},
            {"version", record.version},
            {"executable_path", record.executablePath}};
  if (!record.timestamp.empty())
    j["timestamp"] = record.timestamp;
  if (record.unixTimestamp != 0)
    j["unix_timestamp"] = record.unixTimestamp;
  if (record.pid != 0)
    j["pid"] = record.pid;
  if (!record.claimedAt.empty())
    j["claimed_at"] = record.claimedAt;
  return j;
}

static std::string requireString(const json &j, const char *key,
                                 const std::string &origin) {
  if (!j.contains(key))
    throw CorruptRecord(origin, std::string("missing field '") + key + "'");
  if (!j[key].is_string())
    throw CorruptRecord(origin, std::string("field '") + key +
                                    "' is not a string");
  return j[key].get<std::string>();
}

BuildRecord buildRecordFromJson(const json &j, const std::string &origin) {
  if (!j.is_object())
    throw CorruptRecord(origin, "build record is not an object");

  BuildRecord record;
  record.buildId = requireString(j, "build_id", origin);
  record.version = requireString(j, "version", origin);
  record.executablePath = requireString(j, "executable_path", origin);

  if (record.buildId.empty())
    throw CorruptRecord(origin, "empty build_id");
  if (!isSemanticVersion(record.version))
    throw CorruptRecord(origin, "bad version '" + record.version + "'");

  if (j.contains("timestamp") && j["timestamp"].is_string())
    record.timestamp = j["timestamp"].get<std::string>();
  if (j.contains("unix_timestamp") && j["unix_timestamp"].is_number_integer())
    record.unixTimestamp = j["unix_timestamp"].get<std::int64_t>();
  if (j.contains("pid") && j["pid"].is_number_integer())
    record.pid = j["pid"].get<int>();
  if (j.contains("claimed_at") && j["claimed_at"].is_string())
    record.claimedAt = j["claimed_at"].get<std::string>();

  return record;
}

BuildRecord parseBuildRecord(const std::string &text,
                             const std::string &origin) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded())
    throw CorruptRecord(origin, "invalid JSON");
  return buildRecordFromJson(j, origin);
}

bool isSemanticVersion(const std::string &version) {
  // MAJOR.MINOR.PATCH, optionally followed by -prerelease or +build
  size_t core = version.find_first_of("-+");
  std::string numbers = version.substr(0, core);
  if (core != std::string::npos && core + 1 >= version.size())
    return false;

  int parts = 0;
  size_t start = 0;
  while (true) {
    size_t dot = numbers.find('.', start);
    std::string part = numbers.substr(start, dot == std::string::npos
                                                 ? std::string::npos
                                                 : dot - start);
    if (part.empty())
      return false;
    for (char c : part) {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return false;
    }
    ++parts;
    if (dot == std::string::npos)
      break;
    start = dot + 1;
  }
  return parts == 3;
}

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

} // namespace solo
