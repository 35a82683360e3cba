#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "utils/NameUtils.hpp"

#include <limits>

using namespace utils;
using Catch::Matchers::WithinAbs;

TEST_CASE("numDigit - Counts decimal digits", "[utils]")
{
    REQUIRE(numDigit(0) == 1);
    REQUIRE(numDigit(7) == 1);
    REQUIRE(numDigit(12345) == 5);
    REQUIRE(numDigit(-12345) == 5);
    REQUIRE(numDigit(std::numeric_limits<std::int64_t>::min()) == 19);
}

TEST_CASE("ext and getExt - File extensions", "[utils]")
{
    SECTION("Path extension")
    {
        REQUIRE(ext("trace/archive.tar.gz") == "gz");
        REQUIRE(ext("architecture.yaml") == "yaml");
        REQUIRE(ext("README").empty());
        REQUIRE(ext(".bashrc").empty());
    }

    SECTION("Text after the last dot of the basename")
    {
        REQUIRE(getExt("trace/archive.tar.gz") == "gz");
        REQUIRE(getExt("dir.d/README") == "README");
        REQUIRE(getExt(".bashrc") == "bashrc");
    }
}

TEST_CASE("nsToMs - Nanoseconds to milliseconds", "[utils]")
{
    REQUIRE_THAT(nsToMs(1500000.0), WithinAbs(1.5, 1e-12));
    REQUIRE(nsToMs(0.0) == 0.0);
}

TEST_CASE("toNsAndName - Splits node names", "[utils]")
{
    SECTION("Nested namespace")
    {
        auto [ns, name] = toNsAndName("/sensing/lidar/driver");
        REQUIRE(ns == "/sensing/lidar/");
        REQUIRE(name == "driver");
    }

    SECTION("Root namespace")
    {
        auto [ns, name] = toNsAndName("/driver");
        REQUIRE(ns == "/");
        REQUIRE(name == "driver");
    }

    SECTION("No namespace")
    {
        auto [ns, name] = toNsAndName("driver");
        REQUIRE(ns == "/");
        REQUIRE(name == "driver");
    }
}
