#include <catch2/catch_test_macros.hpp>
#include "app/LookupCli.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using app::LookupCli;

namespace fs = std::filesystem;

namespace
{

struct CliRun
{
    int code;
    std::string out;
    std::string err;
};

CliRun runCli(std::vector<std::string> args)
{
    args.insert(args.begin(), "item-lookup");
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::ostringstream out;
    std::ostringstream err;
    int code = LookupCli(static_cast<int>(args.size()), argv.data(), out, err).run();
    return { code, out.str(), err.str() };
}

} // namespace

TEST_CASE("LookupCli - Similar lookup", "[cli]")
{
    utils::ErrorReporter::ClearErrors();

    SECTION("Exact hit prints the item")
    {
        auto run = runCli({ "robot_node", "robot_node", "other_node" });
        REQUIRE(run.code == LookupCli::Found);
        REQUIRE(run.out == "robot_node\n");
    }

    SECTION("Near miss prints a hint")
    {
        auto run = runCli({ "robot_nod", "robot_node", "completely_different" });
        REQUIRE(run.code == LookupCli::Suggested);
        REQUIRE(run.err.find("Isn't it 'robot_node'?") != std::string::npos);
        REQUIRE(run.out.empty());
    }

    SECTION("Unrelated target is not found")
    {
        auto run = runCli({ "zzz", "robot_node" });
        REQUIRE(run.code == LookupCli::NotFound);
        REQUIRE(run.err.find("Failed find item.") != std::string::npos);
        auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].category == utils::ErrorCategory::Lookup);
        REQUIRE(reports[0].detail == "zzz");
    }

    SECTION("Threshold flag raises the bar")
    {
        auto run = runCli({ "--threshold", "0.99", "robot_nod", "robot_node" });
        REQUIRE(run.code == LookupCli::NotFound);
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("LookupCli - Exact lookup", "[cli]")
{
    SECTION("Unique item")
    {
        auto run = runCli({ "--exact", "b", "a", "b", "c" });
        REQUIRE(run.code == LookupCli::Found);
        REQUIRE(run.out == "b\n");
    }

    SECTION("Duplicate item is ambiguous")
    {
        auto run = runCli({ "--exact", "b", "b", "b" });
        REQUIRE(run.code == LookupCli::NotFound);
        REQUIRE(run.err.find("Failed to identify item.") != std::string::npos);
    }

    SECTION("Near miss gives no hint")
    {
        auto run = runCli({ "--exact", "robot_nod", "robot_node" });
        REQUIRE(run.code == LookupCli::NotFound);
    }
}

TEST_CASE("LookupCli - Usage errors", "[cli]")
{
    REQUIRE(runCli({}).code == LookupCli::Usage);
    REQUIRE(runCli({ "only_target" }).code == LookupCli::Usage);
    REQUIRE(runCli({ "--threshold" }).code == LookupCli::Usage);
    REQUIRE(runCli({ "--threshold", "abc", "a", "b" }).code == LookupCli::Usage);
    REQUIRE(runCli({ "--threshold", "1.5", "a", "b" }).code == LookupCli::Usage);
}

TEST_CASE("LookupCli - Config file", "[cli][config]")
{
    utils::ErrorReporter::ClearErrors();
    const fs::path dir = fs::temp_directory_path() / "lookup_cli_test";
    fs::create_directories(dir);

    SECTION("Missing config file")
    {
        auto run = runCli({ "--config", (dir / "absent.toml").string(), "a", "a" });
        REQUIRE(run.code == LookupCli::ConfigError);
        REQUIRE(run.err.find("Config file not found") != std::string::npos);
    }

    SECTION("Threshold and logging come from the config")
    {
        const fs::path config = dir / "lookup.toml";
        const fs::path log = dir / "logs" / "lookup.log";
        std::ofstream(config) << "[lookup]\nsimilarity_threshold = 0.99\n[logging]\nfile = \"" << log.generic_string()
                              << "\"\n";

        auto run = runCli({ "--config", config.string(), "robot_nod", "robot_node" });
        REQUIRE(run.code == LookupCli::NotFound);
        REQUIRE(utils::LogManager::IsInitialized());
        REQUIRE(fs::exists(log.parent_path()));

        utils::LogManager::Shutdown();
    }

    fs::remove_all(dir);
    utils::ErrorReporter::ClearErrors();
}
