#include <doctest/doctest.h>

#include "solo/classifier.hpp"
#include "test_helpers.hpp"

using namespace solo;
using solo::test::makeBuild;
using solo::test::makeProcess;

TEST_CASE("classify: no process record")
{
    auto current = makeBuild("b2", "2.0.0");
    CHECK(classify(current, std::nullopt, std::nullopt, false) == Classification::NoPriorInstance);
    // A lone build record does not count as a prior instance.
    CHECK(classify(current, std::nullopt, makeBuild("b1", "1.0.0"), false) ==
          Classification::NoPriorInstance);
}

TEST_CASE("classify: dead owner is stale regardless of build")
{
    auto current = makeBuild("b2", "2.0.0");
    CHECK(classify(current, makeProcess(100), makeBuild("b2", "2.0.0"), false) ==
          Classification::StaleRecord);
    CHECK(classify(current, makeProcess(100), std::nullopt, false) == Classification::StaleRecord);
}

TEST_CASE("classify: live owner compared by build id only")
{
    auto current = makeBuild("b2", "2.0.0");
    CHECK(classify(current, makeProcess(100), makeBuild("b2", "2.0.0"), true) ==
          Classification::LiveSameBuild);
    // Same version, different build id.
    CHECK(classify(current, makeProcess(100), makeBuild("b3", "2.0.0"), true) ==
          Classification::LiveDifferentBuild);
    // Same build id, version differs: still the same build.
    CHECK(classify(current, makeProcess(100), makeBuild("b2", "9.9.9"), true) ==
          Classification::LiveSameBuild);
    // Unknown build of a live owner.
    CHECK(classify(current, makeProcess(100), std::nullopt, true) ==
          Classification::LiveDifferentBuild);
}

TEST_CASE("compareVersions is numeric")
{
    CHECK(compareVersions("1.2.3", "1.2.3") == 0);
    CHECK(compareVersions("1.10.0", "1.9.0") == 1);
    CHECK(compareVersions("0.9.9", "1.0.0") == -1);
    CHECK(compareVersions("2.0.0-rc1", "2.0.0") == 0);
}

TEST_CASE("compareAge prefers build timestamps over versions")
{
    auto current = makeBuild("new", "1.0.0", 2000);
    CHECK(compareAge(current, makeBuild("old", "5.0.0", 1000)) == BuildAge::Older);
    CHECK(compareAge(current, makeBuild("newer", "0.1.0", 3000)) == BuildAge::Newer);
    CHECK(compareAge(current, makeBuild("v", "0.9.0")) == BuildAge::Older);
    CHECK(compareAge(current, makeBuild("v", "1.0.0")) == BuildAge::Unknown);
    CHECK(compareAge(current, makeBuild("new", "1.0.0", 2000)) == BuildAge::Same);
}

TEST_CASE("describeCollision wording")
{
    auto current = makeBuild("b2", "2.0.0", 2000);
    CHECK(describeCollision(Classification::LiveSameBuild, current, current) ==
          "The same build is currently running. Replace the running instance?");
    CHECK(describeCollision(Classification::LiveDifferentBuild, current,
                            makeBuild("b1", "1.0.0", 1000)) ==
          "An older build is currently running. Replace it with this newer build?");
    CHECK(describeCollision(Classification::LiveDifferentBuild, current,
                            makeBuild("b3", "3.0.0", 3000)) ==
          "A newer build is currently running. Replace it with this older build?");
    CHECK(describeCollision(Classification::LiveDifferentBuild, current, std::nullopt)
              .find("unknown build") != std::string::npos);
}
