#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "cmdguard/core/error.hpp"

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// can carry optional policy fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace cmdguard::policy {

using json = nlohmann::json;

struct CircuitBreakerConfig {
    static constexpr int kDefaultThreshold = 10;

    bool enabled = true;
    int threshold = kDefaultThreshold;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CircuitBreakerConfig, enabled, threshold)

/// One named policy variant ("development", "testing", ...).
struct ProfileConfig {
    std::vector<std::string> safe_commands;
    std::vector<std::string> blocked_patterns;
    bool sandbox_enabled = true;
    std::optional<CircuitBreakerConfig> circuit_breaker;

    // Overrides for the built-in detector lists.
    std::optional<std::vector<std::string>> shell_injection_patterns;
    std::optional<std::vector<std::string>> path_traversal_patterns;
    std::optional<std::vector<std::string>> blocked_paths;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ProfileConfig, safe_commands, blocked_patterns,
    sandbox_enabled, circuit_breaker, shell_injection_patterns, path_traversal_patterns,
    blocked_paths)

struct Policy {
    std::string version;
    std::map<std::string, ProfileConfig> profiles;
    std::string default_profile = "development";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Policy, version, profiles, default_profile)

/// Breaker settings for a profile, with documented defaults applied.
inline auto effective_breaker(const ProfileConfig& profile) -> CircuitBreakerConfig {
    return profile.circuit_breaker.value_or(CircuitBreakerConfig{});
}

/// Minimal shape check of a single profile object: `safe_commands` and
/// `blocked_patterns` must be arrays and `sandbox_enabled` a boolean.
/// Suitable for linting candidate documents before installing them.
auto validate(const json& profile) -> bool;

/// Full check of a profile object. The error names the offending field as
/// a dotted path rooted at `where` (e.g. "profiles.dev.safe_commands").
auto validate_profile(const json& profile, std::string_view where) -> VoidResult;

/// Checks a complete policy document: `profiles` present and an object,
/// every profile valid, and `default_profile` (when given) naming one of
/// the profiles.
auto validate_policy_document(const json& document) -> VoidResult;

/// Validates and converts a policy document.
auto parse_policy(const json& document) -> Result<Policy>;

/// The policy compiled into the binary, used when no file is found.
auto bundled_policy_document() -> const json&;
auto bundled_policy() -> Policy;

} // namespace cmdguard::policy
