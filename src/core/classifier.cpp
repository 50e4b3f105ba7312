#include "solo/classifier.hpp"

#include <array>
#include <sstream>

namespace solo {

std::string toString(Classification c) {
  switch (c) {
  case Classification::NoPriorInstance:
    return "NoPriorInstance";
  case Classification::StaleRecord:
    return "StaleRecord";
  case Classification::LiveSameBuild:
    return "LiveSameBuild";
  case Classification::LiveDifferentBuild:
    return "LiveDifferentBuild";
  }
  return "Unknown";
}

Classification classify(const BuildRecord &currentBuild,
                        const std::optional<ProcessRecord> &priorProcess,
                        const std::optional<BuildRecord> &priorBuild,
                        bool alive) {
  if (!priorProcess)
    return Classification::NoPriorInstance;
  if (!alive)
    return Classification::StaleRecord;
  // A live owner without a readable build record cannot be shown to be the
  // same build.
  if (priorBuild && priorBuild->buildId == currentBuild.buildId)
    return Classification::LiveSameBuild;
  return Classification::LiveDifferentBuild;
}

static std::array<long, 3> versionParts(const std::string &v) {
  std::array<long, 3> parts{0, 0, 0};
  std::string core = v.substr(0, v.find_first_of("-+"));
  std::istringstream ss(core);
  std::string item;
  for (size_t i = 0; i < parts.size() && std::getline(ss, item, '.'); ++i) {
    try {
      parts[i] = std::stol(item);
    } catch (const std::exception &) {
      parts[i] = 0;
    }
  }
  return parts;
}

int compareVersions(const std::string &a, const std::string &b) {
  auto pa = versionParts(a);
  auto pb = versionParts(b);
  for (size_t i = 0; i < pa.size(); ++i) {
    if (pa[i] < pb[i])
      return -1;
    if (pa[i] > pb[i])
      return 1;
  }
  return 0;
}

BuildAge compareAge(const BuildRecord &current, const BuildRecord &prior) {
  if (current.buildId == prior.buildId)
    return BuildAge::Same;

  if (current.unixTimestamp != 0 && prior.unixTimestamp != 0 &&
      current.unixTimestamp != prior.unixTimestamp) {
    return prior.unixTimestamp < current.unixTimestamp ? BuildAge::Older
                                                       : BuildAge::Newer;
  }

  int cmp = compareVersions(prior.version, current.version);
  if (cmp < 0)
    return BuildAge::Older;
  if (cmp > 0)
    return BuildAge::Newer;
  return BuildAge::Unknown;
}

std::string describeCollision(Classification c, const BuildRecord &current,
                              const std::optional<BuildRecord> &prior) {
  if (c == Classification::LiveSameBuild)
    return "The same build is currently running. Replace the running "
           "instance?";
  if (!prior)
    return "Another instance of unknown build is currently running. Replace "
           "it with this build?";

  switch (compareAge(current, *prior)) {
  case BuildAge::Older:
    return "An older build is currently running. Replace it with this newer "
           "build?";
  case BuildAge::Newer:
    return "A newer build is currently running. Replace it with this older "
           "build?";
  default:
    return "A different build is currently running. Replace it with this "
           "build?";
  }
}

} // namespace solo
