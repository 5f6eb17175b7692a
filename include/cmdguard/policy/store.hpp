#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cmdguard/core/error.hpp"
#include "cmdguard/policy/policy.hpp"

namespace cmdguard::policy {

/// Where the resolved policy came from.
enum class PolicySource {
    Explicit,
    ProjectRoot,    // <root>/.claude/sandbox_policy.json
    ProjectConfig,  // <root>/.claude/config/sandbox_policy.json
    Bundled,
};

auto policy_source_to_string(PolicySource source) -> std::string_view;

/// A policy flattened onto the profile that will be enforced.
struct LoadedPolicy {
    Policy policy;
    std::string active_profile;
    ProfileConfig profile;
    PolicySource source = PolicySource::Bundled;
    std::optional<std::filesystem::path> path;
};

/// Cascade candidates in priority order (root-level file first).
auto cascade_candidates(const std::filesystem::path& project_root)
    -> std::vector<std::filesystem::path>;

/// Reads and parses a JSON file. NotFound when the file is absent,
/// SerializationError when it is unreadable or not valid JSON.
auto read_policy_file(const std::filesystem::path& path) -> Result<json>;

/// Picks `requested` from the policy, or falls back to `default_profile`
/// when it does not exist. Fails only if the fallback is missing too.
auto select_profile(const Policy& policy, std::string_view requested)
    -> Result<std::pair<std::string, ProfileConfig>>;

/// Loads the policy to enforce.
///
/// With an explicit path: a missing or corrupt file falls back to the
/// bundled policy, a schema violation is a PolicyValidation error.
/// Without one: the cascade candidates are tried in order and the first
/// that exists, parses and validates wins; otherwise the bundled policy.
auto load_policy(const std::optional<std::filesystem::path>& explicit_path,
                 std::string_view profile_name,
                 const std::filesystem::path& project_root) -> Result<LoadedPolicy>;

} // namespace cmdguard::policy
