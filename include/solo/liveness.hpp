#ifndef SOLO_LIVENESS_HPP
#define SOLO_LIVENESS_HPP

#include <functional>
#include <optional>
#include <string>

namespace solo {

class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;

    // Whether `pid` is still the process that wrote the record. When
    // expectedExe is non-empty it is used to rule out a recycled pid.
    virtual bool isAlive(int pid, const std::string& expectedExe = "") = 0;
};

// kill(pid, 0) plus a /proc/<pid>/exe cross-check.
class SystemLivenessProbe : public LivenessProbe {
public:
    // Image of a pid, nullopt when it cannot be read.
    using ExeLookup = std::function<std::optional<std::string>(int)>;

    explicit SystemLivenessProbe(bool verifyExecutable = true, ExeLookup exeLookup = {});

    bool isAlive(int pid, const std::string& expectedExe = "") override;

private:
    bool verifyExecutable_;
    ExeLookup exeLookup_;
};

} // namespace solo

#endif // SOLO_LIVENESS_HPP
