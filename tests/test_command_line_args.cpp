// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Options are case-insensitive, values keep their case
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string>
#include <vector>

namespace {

[[nodiscard]] frontier::app::CommandLineArgs Parse(std::initializer_list<const char*> argv)
{
    std::vector<std::string> storage(argv.begin(), argv.end());
    std::vector<char*> ptrs;
    ptrs.reserve(storage.size());
    for (std::string& s : storage)
        ptrs.push_back(s.data());
    return frontier::app::ParseCommandLineArgs(static_cast<int>(ptrs.size()), ptrs.data());
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({"frontier_sim", "--VERBOSE", "--No-Disaster"});

    CHECK(args.verbose);
    CHECK_FALSE(args.disaster);
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts separate and = values")
{
    const auto args = Parse({
        "frontier_sim",
        "--hours", "72",
        "--SETTLEMENTS=8",
        "--threads=2",
        "--seed", "-17",
        "--Config=Data/Sim.json",
        "--dump", "Out/State.json",
    });

    REQUIRE(args.hours);
    REQUIRE(args.settlements);
    REQUIRE(args.threads);
    REQUIRE(args.seed);
    CHECK(args.hours.value() == 72);
    CHECK(args.settlements.value() == 8);
    CHECK(args.threads.value() == 2);
    CHECK(args.seed.value() == -17);
    REQUIRE(args.configPath);
    CHECK(args.configPath.value() == "Data/Sim.json");
    REQUIRE(args.dumpPath);
    CHECK(args.dumpPath.value() == "Out/State.json");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "frontier_sim",
        "--hours=-3",
        "--bogus",
        "--threads", "many",
        "--catalog",
    });

    CHECK_FALSE(args.hours.has_value());
    CHECK_FALSE(args.threads.has_value());
    CHECK_FALSE(args.catalogPath.has_value());
    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--hours=-3");
    CHECK(args.unknown[1] == "--bogus");
    CHECK(args.unknown[2] == "--threads");
    CHECK(args.unknown[3] == "--catalog");
}

TEST_CASE("CommandLineArgs help flag and help text")
{
    CHECK(Parse({"frontier_sim", "-h"}).showHelp);
    CHECK(Parse({"frontier_sim", "--HELP"}).showHelp);

    const std::string help = frontier::app::BuildCommandLineHelpText();
    CHECK(help.find("--hours") != std::string::npos);
    CHECK(help.find("--dump") != std::string::npos);
}
