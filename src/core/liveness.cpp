#include "solo/liveness.hpp"
#include "solo/logger.hpp"
#include "solo/process.hpp"

#include <filesystem>
#include <utility>

namespace solo {

namespace {

// U+FFFD: the record was written from a path that is not valid UTF-8.
bool lossyPath(const std::string& path) {
    return path.find("\xEF\xBF\xBD") != std::string::npos;
}

} // namespace

SystemLivenessProbe::SystemLivenessProbe(bool verifyExecutable, ExeLookup exeLookup)
    : verifyExecutable_(verifyExecutable), exeLookup_(std::move(exeLookup)) {
    if (!exeLookup_) exeLookup_ = &Process::getProcessExe;
}

bool SystemLivenessProbe::isAlive(int pid, const std::string& expectedExe) {
    if (pid <= 0) return false;
    if (!Process::exists(pid)) return false;
    if (Process::isZombie(pid)) return false;

    if (!verifyExecutable_ || expectedExe.empty()) return true;

    if (lossyPath(expectedExe)) {
        LOG_DEBUG("Liveness: recorded image of pid " + std::to_string(pid) + " is not exact, skipping check");
        return true;
    }

    auto exe = exeLookup_(pid);
    if (!exe) {
        // Cannot see the image; assume it is the recorded instance.
        LOG_DEBUG("Liveness: image of pid " + std::to_string(pid) + " unverifiable, treating as alive");
        return true;
    }

    std::error_code ec;
    auto expected = std::filesystem::weakly_canonical(expectedExe, ec);
    std::string expectedStr = ec ? expectedExe : expected.string();
    if (*exe == expectedStr || *exe == expectedExe) return true;

    LOG_INFO("Liveness: pid " + std::to_string(pid) + " now runs " + *exe +
             ", recorded " + expectedExe + "; pid was recycled");
    return false;
}

} // namespace solo
