#include <doctest/doctest.h>

#include "solo/config.hpp"
#include "test_helpers.hpp"

#include <fstream>

using namespace solo;
using solo::test::TempDir;

namespace {

void writeFile(const std::filesystem::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::trunc);
    f << text;
}

std::string readFile(const std::filesystem::path& p) {
    std::ifstream f(p);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Config: a missing file is created with defaults")
{
    TempDir tmp;
    auto path = tmp.path() / "config.json";
    auto& cfg = Config::instance();
    cfg.load(path);

    CHECK(cfg.loadedCleanly());
    CHECK(cfg.getConfirm().mode == "auto");
    CHECK(cfg.getConfirm().timeoutSeconds == 30);
    CHECK(cfg.getTermination().pollAttempts == 8);
    CHECK(cfg.getLiveness().verifyExecutable);
    CHECK_FALSE(cfg.getLog().verbose);

    REQUIRE(std::filesystem::exists(path));
    auto j = nlohmann::json::parse(readFile(path));
    CHECK(j["confirm"]["timeout_seconds"] == 30);
    CHECK(j["termination"]["kill_poll_attempts"] == 10);
}

TEST_CASE("Config: values are read and sanitized")
{
    TempDir tmp;
    auto path = tmp.path() / "config.json";
    writeFile(path, R"({
        "confirm": { "mode": "terminal", "timeout_seconds": 0 },
        "termination": { "poll_attempts": 3, "initial_interval_ms": 50, "backoff_factor": 1.5 },
        "liveness": { "verify_executable": false },
        "log": { "verbose": true }
    })");

    auto& cfg = Config::instance();
    cfg.load(path);
    CHECK(cfg.loadedCleanly());
    CHECK(cfg.getConfirm().mode == "terminal");
    CHECK(cfg.getConfirm().timeoutSeconds == 1);
    CHECK(cfg.getTermination().pollAttempts == 3);
    CHECK(cfg.getTermination().maxIntervalMs == 2000);
    CHECK_FALSE(cfg.getLiveness().verifyExecutable);
    CHECK(cfg.getLog().verbose);

    auto budget = cfg.getTermination().budget();
    CHECK(budget.pollAttempts == 3);
    CHECK(budget.initialInterval.count() == 50);
    CHECK(budget.backoffFactor == doctest::Approx(1.5));

    // New keys were written back.
    auto j = nlohmann::json::parse(readFile(path));
    CHECK(j["termination"]["kill_poll_interval_ms"] == 200);
}

TEST_CASE("Config: unknown confirm mode falls back to auto")
{
    TempDir tmp;
    auto path = tmp.path() / "config.json";
    writeFile(path, R"({"confirm": {"mode": "sometimes"}})");

    auto& cfg = Config::instance();
    cfg.load(path);
    CHECK(cfg.getConfirm().mode == "auto");
}

TEST_CASE("Config: an unparseable file is left alone and defaults apply")
{
    TempDir tmp;
    auto path = tmp.path() / "config.json";
    writeFile(path, R"({"log": {"verbose": true)");

    auto& cfg = Config::instance();
    cfg.load(path);
    CHECK_FALSE(cfg.loadedCleanly());
    CHECK_FALSE(cfg.getLog().verbose);
    CHECK(readFile(path) == R"({"log": {"verbose": true)");

    cfg.reset();
    CHECK(cfg.loadedCleanly());
}

TEST_CASE("TerminationConfig: budget clamps nonsense")
{
    TerminationConfig t;
    t.pollAttempts = -4;
    t.backoffFactor = 0.1;
    t.killPollIntervalMs = 0;
    auto b = t.budget();
    CHECK(b.pollAttempts == 1);
    CHECK(b.backoffFactor == doctest::Approx(1.0));
    CHECK(b.killPollInterval.count() == 1);
}

TEST_CASE("TerminationConfig: budget caps the worst case")
{
    TerminationConfig t;
    t.pollAttempts = 100000;
    t.initialIntervalMs = 60000;
    t.backoffFactor = 1e300;
    t.maxIntervalMs = 3600000;
    t.killPollAttempts = 5000;
    t.killPollIntervalMs = 60000;
    auto b = t.budget();

    CHECK(b.pollAttempts == 15);
    CHECK(b.maxInterval.count() == 2000);
    CHECK(b.initialInterval.count() == 2000);
    CHECK(b.backoffFactor == doctest::Approx(4.0));
    CHECK(b.killPollAttempts == 10);
    CHECK(b.killPollInterval.count() == 500);
    CHECK(b.worstCase().count() == 15 * 2000 + 10 * 500);
}

TEST_CASE("TerminationConfig: defaults are within the caps")
{
    auto b = TerminationConfig{}.budget();
    CHECK(b.worstCase().count() == 9100 + 2000);
}
