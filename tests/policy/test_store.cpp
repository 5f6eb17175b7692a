#include <catch2/catch_test_macros.hpp>

#include "cmdguard/policy/store.hpp"

#include <filesystem>
#include <fstream>
#include <random>

using namespace cmdguard::policy;
namespace fs = std::filesystem;

namespace {

/// Fresh project root under the system temp directory, removed on scope exit.
struct TempProject {
    fs::path root;

    TempProject() {
        std::random_device rd;
        root = fs::temp_directory_path() /
               ("cmdguard_store_test_" + std::to_string(rd()));
        fs::create_directories(root);
    }

    ~TempProject() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const fs::path& relative, std::string_view content) const {
        auto path = root / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }
};

auto policy_json(std::string_view safe_command, int threshold = 10) -> std::string {
    json doc = {
        {"version", "1.0.0"},
        {"profiles", {
            {"development", {
                {"safe_commands", json::array({std::string(safe_command)})},
                {"blocked_patterns", json::array({"sudo"})},
                {"sandbox_enabled", true},
                {"circuit_breaker", {{"enabled", true}, {"threshold", threshold}}},
            }},
            {"testing", {
                {"safe_commands", json::array({"pytest"})},
                {"blocked_patterns", json::array()},
                {"sandbox_enabled", false},
            }},
        }},
        {"default_profile", "development"},
    };
    return doc.dump();
}

} // namespace

// ---------------------------------------------------------------------------
// cascade_candidates / read_policy_file
// ---------------------------------------------------------------------------

TEST_CASE("cascade_candidates lists root-level file first", "[policy][store]") {
    auto candidates = cascade_candidates("/work/project");
    REQUIRE(candidates.size() == 2);
    CHECK(candidates[0] == fs::path("/work/project/.claude/sandbox_policy.json"));
    CHECK(candidates[1] == fs::path("/work/project/.claude/config/sandbox_policy.json"));
}

TEST_CASE("read_policy_file distinguishes missing and corrupt files", "[policy][store]") {
    TempProject project;

    SECTION("missing") {
        auto r = read_policy_file(project.root / "nope.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == cmdguard::ErrorCode::NotFound);
    }

    SECTION("corrupt") {
        project.write("bad.json", "{ not json");
        auto r = read_policy_file(project.root / "bad.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == cmdguard::ErrorCode::SerializationError);
    }

    SECTION("valid") {
        project.write("good.json", R"({"a": 1})");
        auto r = read_policy_file(project.root / "good.json");
        REQUIRE(r.has_value());
        CHECK((*r)["a"] == 1);
    }
}

// ---------------------------------------------------------------------------
// load_policy: explicit path
// ---------------------------------------------------------------------------

TEST_CASE("explicit policy file is loaded", "[policy][store]") {
    TempProject project;
    project.write("policy.json", policy_json("make"));

    auto loaded = load_policy(project.root / "policy.json", "development", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->source == PolicySource::Explicit);
    CHECK(loaded->active_profile == "development");
    CHECK(loaded->profile.safe_commands == std::vector<std::string>{"make"});
    REQUIRE(loaded->path.has_value());
    CHECK(*loaded->path == project.root / "policy.json");
}

TEST_CASE("missing explicit policy falls back to bundled", "[policy][store]") {
    TempProject project;

    auto loaded = load_policy(project.root / "missing.json", "development", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->source == PolicySource::Bundled);
    CHECK(loaded->active_profile == "development");
    CHECK_FALSE(loaded->path.has_value());
}

TEST_CASE("corrupt explicit policy falls back to bundled", "[policy][store]") {
    TempProject project;
    project.write("policy.json", "{ \"profiles\": ");

    auto loaded = load_policy(project.root / "policy.json", "development", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->source == PolicySource::Bundled);
}

TEST_CASE("explicit policy failing schema validation is an error", "[policy][store]") {
    TempProject project;

    SECTION("profiles missing") {
        project.write("policy.json", R"({"version": "1.0.0"})");
        auto loaded = load_policy(project.root / "policy.json", "development", project.root);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code() == cmdguard::ErrorCode::PolicyValidation);
        CHECK(loaded.error().what().find("profiles") != std::string::npos);
    }

    SECTION("profile missing safe_commands") {
        project.write("policy.json",
            R"({"profiles": {"development": {"blocked_patterns": [], "sandbox_enabled": true}}})");
        auto loaded = load_policy(project.root / "policy.json", "development", project.root);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().what().find("safe_commands") != std::string::npos);
    }

    SECTION("wrong field type") {
        project.write("policy.json",
            R"({"profiles": {"development": {"safe_commands": [], "blocked_patterns": [],
                "sandbox_enabled": "yes"}}})");
        auto loaded = load_policy(project.root / "policy.json", "development", project.root);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().what().find("sandbox_enabled") != std::string::npos);
    }
}

// ---------------------------------------------------------------------------
// load_policy: cascade
// ---------------------------------------------------------------------------

TEST_CASE("cascade prefers the root-level policy", "[policy][store][cascade]") {
    TempProject project;
    project.write(".claude/sandbox_policy.json", policy_json("root-tool"));
    project.write(".claude/config/sandbox_policy.json", policy_json("config-tool"));

    auto loaded = load_policy(std::nullopt, "development", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->source == PolicySource::ProjectRoot);
    CHECK(loaded->profile.safe_commands == std::vector<std::string>{"root-tool"});
}

TEST_CASE("cascade uses the config subdirectory when the root file is absent", "[policy][store][cascade]") {
    TempProject project;
    project.write(".claude/config/sandbox_policy.json", policy_json("config-tool"));

    auto loaded = load_policy(std::nullopt, "development", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->source == PolicySource::ProjectConfig);
    CHECK(loaded->profile.safe_commands == std::vector<std::string>{"config-tool"});
}

TEST_CASE("cascade skips corrupt and invalid candidates", "[policy][store][cascade]") {
    TempProject project;

    SECTION("corrupt root file") {
        project.write(".claude/sandbox_policy.json", "not json at all");
        project.write(".claude/config/sandbox_policy.json", policy_json("config-tool"));

        auto loaded = load_policy(std::nullopt, "development", project.root);
        REQUIRE(loaded.has_value());
        CHECK(loaded->source == PolicySource::ProjectConfig);
    }

    SECTION("schema-invalid root file") {
        project.write(".claude/sandbox_policy.json", R"({"version": "2"})");

        auto loaded = load_policy(std::nullopt, "development", project.root);
        REQUIRE(loaded.has_value());
        CHECK(loaded->source == PolicySource::Bundled);
    }
}

TEST_CASE("cascade miss uses the bundled policy", "[policy][store][cascade]") {
    TempProject project;

    auto loaded = load_policy(std::nullopt, "production", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->source == PolicySource::Bundled);
    CHECK(loaded->active_profile == "production");
    REQUIRE(loaded->profile.circuit_breaker.has_value());
    CHECK(loaded->profile.circuit_breaker->threshold == 3);
}

// ---------------------------------------------------------------------------
// profile selection
// ---------------------------------------------------------------------------

TEST_CASE("unknown profile falls back to default_profile", "[policy][store]") {
    TempProject project;
    project.write("policy.json", policy_json("make"));

    auto loaded = load_policy(project.root / "policy.json", "staging", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->active_profile == "development");
    CHECK(loaded->profile.safe_commands == std::vector<std::string>{"make"});
}

TEST_CASE("requested profile is selected when present", "[policy][store]") {
    TempProject project;
    project.write("policy.json", policy_json("make"));

    auto loaded = load_policy(project.root / "policy.json", "testing", project.root);
    REQUIRE(loaded.has_value());
    CHECK(loaded->active_profile == "testing");
    CHECK_FALSE(loaded->profile.sandbox_enabled);
    CHECK_FALSE(loaded->profile.circuit_breaker.has_value());
}

TEST_CASE("select_profile fails when default_profile is missing too", "[policy][store]") {
    Policy policy;
    policy.default_profile = "ghost";
    policy.profiles["development"] = ProfileConfig{};

    auto selected = select_profile(policy, "staging");
    REQUIRE_FALSE(selected.has_value());
    CHECK(selected.error().code() == cmdguard::ErrorCode::PolicyValidation);
}

TEST_CASE("policy_source_to_string", "[policy][store]") {
    CHECK(policy_source_to_string(PolicySource::Explicit) == "explicit");
    CHECK(policy_source_to_string(PolicySource::ProjectRoot) == "project");
    CHECK(policy_source_to_string(PolicySource::ProjectConfig) == "project-config");
    CHECK(policy_source_to_string(PolicySource::Bundled) == "bundled");
}
