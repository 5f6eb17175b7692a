#include <catch2/catch_test_macros.hpp>

#include "cmdguard/cli/app.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace cmdguard::cli;
namespace fs = std::filesystem;

namespace {

constexpr const char* kPolicy = R"({
    "version": "1.0.0",
    "profiles": {
        "development": {
            "safe_commands": ["cat", "git status"],
            "blocked_patterns": ["rm -rf", "sudo"],
            "sandbox_enabled": false
        }
    },
    "default_profile": "development"
})";

struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("cmdguard_cli_test_" + std::to_string(rd()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    auto write(const std::string& name, std::string_view content) const -> fs::path {
        auto p = path / name;
        std::ofstream out(p);
        out << content;
        return p;
    }
};

auto run(std::vector<std::string> args) -> int {
    args.insert(args.begin(), "cmdguard");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    App app;
    return app.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("exit_code_for maps classifications", "[cli]") {
    using cmdguard::sandbox::Classification;
    CHECK(exit_code_for(Classification::Safe) == kExitOk);
    CHECK(exit_code_for(Classification::Blocked) == kExitBlocked);
    CHECK(exit_code_for(Classification::NeedsApproval) == kExitNeedsApproval);
}

TEST_CASE("classify exit codes follow the classification", "[cli]") {
    TempDir dir;
    auto policy = dir.write("policy.json", kPolicy).string();

    CHECK(run({"--policy", policy, "--log-level", "off", "classify", "--", "cat", "README.md"}) == kExitOk);
    CHECK(run({"--policy", policy, "--log-level", "off", "classify", "--", "rm", "-rf", "/"}) == kExitBlocked);
    CHECK(run({"--policy", policy, "--log-level", "off", "classify", "--", "npx", "create-react-app"}) ==
          kExitNeedsApproval);
}

TEST_CASE("classify fails on an invalid explicit policy", "[cli]") {
    TempDir dir;
    auto policy = dir.write("policy.json", R"({"version": "1.0.0"})").string();

    CHECK(run({"--policy", policy, "--log-level", "off", "classify", "--", "ls"}) == kExitError);
}

TEST_CASE("wrap refuses blocked commands", "[cli]") {
    TempDir dir;
    auto policy = dir.write("policy.json", kPolicy).string();

    CHECK(run({"--policy", policy, "--log-level", "off", "wrap", "--", "sudo", "ls"}) == kExitBlocked);
    CHECK(run({"--policy", policy, "--log-level", "off", "wrap", "--ro", "/usr", "--", "cat", "x"}) ==
          kExitOk);
}

TEST_CASE("validate lints policy files", "[cli]") {
    TempDir dir;

    SECTION("valid") {
        auto policy = dir.write("good.json", kPolicy).string();
        CHECK(run({"validate", policy}) == kExitOk);
    }

    SECTION("schema violation") {
        auto policy = dir.write("bad.json", R"({"profiles": {"dev": {"safe_commands": []}}})").string();
        CHECK(run({"validate", policy}) == kExitError);
    }

    SECTION("not JSON") {
        auto policy = dir.write("corrupt.json", "{").string();
        CHECK(run({"validate", policy}) == kExitError);
    }
}

TEST_CASE("audit log receives classification events", "[cli]") {
    TempDir dir;
    auto policy = dir.write("policy.json", kPolicy).string();
    auto audit_log = (dir.path / "audit.jsonl").string();

    CHECK(run({"--policy", policy, "--log-level", "off", "--audit-log", audit_log,
               "classify", "--", "cat", "README.md"}) == kExitOk);

    std::ifstream in(audit_log);
    std::string line;
    REQUIRE(std::getline(in, line));
    auto event = nlohmann::json::parse(line);
    CHECK(event["event_type"] == "sandbox_classification");
    CHECK(event["context"]["command"] == "cat README.md");

    spdlog::drop("audit:" + audit_log);
}

TEST_CASE("a subcommand is required", "[cli]") {
    CHECK(run({}) != kExitOk);
}

TEST_CASE("which reports the host sandbox binary", "[cli]") {
    CHECK(run({"which"}) == kExitOk);
}
