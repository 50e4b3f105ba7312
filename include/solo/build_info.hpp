#ifndef SOLO_BUILD_INFO_HPP
#define SOLO_BUILD_INFO_HPP

#include "solo/identity.hpp"

#include <filesystem>
#include <optional>

namespace solo {

class BuildInfo {
public:
    // Identity of the running executable. Computed once.
    static const BuildRecord& current();

    // Reads build_id.json beside the executable or in ../share/solo.
    static std::optional<BuildRecord> loadEmbedded(const std::filesystem::path& exeDir);

    // Values baked in at configure time.
    static BuildRecord compiled();

private:
    static BuildRecord resolve();
};

} // namespace solo

#endif // SOLO_BUILD_INFO_HPP
