#ifndef SOLO_DIAGNOSTICS_HPP
#define SOLO_DIAGNOSTICS_HPP

#include "solo/identity.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace solo {

class IdentityStore;
class LivenessProbe;

struct HealthStatus {
    bool ok;
    std::string message;
    std::string detail;
    bool fixable = false;
    std::function<void(std::function<void(float, std::string)>)> fixAction;

    std::string category = "General";
    std::vector<std::string> tags;
};

// Category Constants
namespace HealthCategory {
    const std::string CRITICAL = "Critical";
    const std::string CONFIG = "Configuration";
    const std::string RECORDS = "Identity Records";
    const std::string LEGACY = "Legacy Cleanup";
}

class Diagnostics {
public:
    Diagnostics(IdentityStore& store, LivenessProbe& probe, BuildRecord current);

    // Runs all health checks and returns true if all are OK
    bool runChecks();

    const std::vector<std::pair<std::string, HealthStatus>>& getResults() const { return results_; }

    // Returns number of failing checks
    int failureCount() const;

    // Runs the fix of a failing check. False if there is none.
    bool fixIssue(const std::string& name, std::function<void(float, std::string)> progressCb);

private:
    IdentityStore& store_;
    LivenessProbe& probe_;
    BuildRecord current_;
    std::vector<std::pair<std::string, HealthStatus>> results_;

    // Filled by checkRecords() for the checks after it
    std::optional<ProcessRecord> process_;
    std::optional<BuildRecord> build_;
    bool buildMismatch_ = false;

    void checkRoot();
    void checkConfig();
    void checkRecords();
    void checkInstance();
    void checkBuildMatch();
    void checkLegacy();

    std::function<void(std::function<void(float, std::string)>)> clearAction();
};

} // namespace solo

#endif // SOLO_DIAGNOSTICS_HPP
