#ifndef SOLO_CLASSIFIER_HPP
#define SOLO_CLASSIFIER_HPP

#include "solo/identity.hpp"

#include <optional>
#include <string>

namespace solo {

enum class Classification {
  NoPriorInstance,
  StaleRecord,
  LiveSameBuild,
  LiveDifferentBuild
};

std::string toString(Classification c);

// Rules, in order: no process record; not alive; same build id; otherwise
// different build. Versions never take part.
Classification classify(const BuildRecord &currentBuild,
                        const std::optional<ProcessRecord> &priorProcess,
                        const std::optional<BuildRecord> &priorBuild,
                        bool alive);

enum class BuildAge { Older, Newer, Same, Unknown };

// Age of `prior` relative to `current`: build timestamp first, then
// semantic version. Informational only.
BuildAge compareAge(const BuildRecord &current, const BuildRecord &prior);

// Numeric MAJOR.MINOR.PATCH comparison, -1/0/1. Suffixes are ignored.
int compareVersions(const std::string &a, const std::string &b);

// One-line question shown to the user for a live collision.
std::string describeCollision(Classification c, const BuildRecord &current,
                              const std::optional<BuildRecord> &prior);

} // namespace solo

#endif // SOLO_CLASSIFIER_HPP
