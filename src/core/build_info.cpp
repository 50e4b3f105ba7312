#include "solo/build_info.hpp"
#include "solo/build_stamp.hpp"
#include "solo/logger.hpp"
#include "solo/process.hpp"
#include "solo/version.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace solo {

using json = nlohmann::json;

const BuildRecord& BuildInfo::current() {
    static const BuildRecord record = resolve();
    return record;
}

BuildRecord BuildInfo::compiled() {
    BuildRecord record;
    record.buildId = SOLO_BUILD_ID;
    record.version = SOLO_VERSION_STRING;
    record.timestamp = SOLO_BUILD_TIMESTAMP;
    record.unixTimestamp = SOLO_BUILD_UNIX_TIMESTAMP;
    return record;
}

std::optional<BuildRecord> BuildInfo::loadEmbedded(const std::filesystem::path& exeDir) {
    const std::filesystem::path candidates[] = {
        exeDir / "build_id.json",
        exeDir.parent_path() / "share" / "solo" / "build_id.json",
    };

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;

        std::ifstream file(path);
        json j = json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("build_id") ||
            !j["build_id"].is_string() || j["build_id"].get<std::string>().empty()) {
            LOG_WARN("Ignoring malformed build stamp " + path.string());
            continue;
        }

        BuildRecord record;
        record.buildId = j["build_id"].get<std::string>();
        record.version = j.value("version", SOLO_VERSION_STRING);
        if (!isSemanticVersion(record.version)) {
            record.version = SOLO_VERSION_STRING;
        }
        record.timestamp = j.value("timestamp", "");
        if (j.contains("unix_timestamp") && j["unix_timestamp"].is_number_integer()) {
            record.unixTimestamp = j["unix_timestamp"].get<std::int64_t>();
        }
        LOG_DEBUG("Build identity from " + path.string());
        return record;
    }
    return std::nullopt;
}

BuildRecord BuildInfo::resolve() {
    auto exe = Process::selfExe();
    std::filesystem::path exePath = exe.value_or("");

    BuildRecord record;
    auto embedded = exePath.empty() ? std::nullopt : loadEmbedded(exePath.parent_path());
    record = embedded ? *embedded : compiled();
    record.executablePath = exePath.string();
    return record;
}

} // namespace solo
