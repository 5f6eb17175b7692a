#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cmdguard {

inline constexpr std::string_view kDefaultProfileName = "development";

/// Construction-time settings for a SandboxEnforcer.
///
/// Everything the enforcer would otherwise read from the process
/// environment is resolved into this struct once, before construction.
struct EnforcerConfig {
    /// Explicit policy file. When unset the cascade is searched.
    std::optional<std::filesystem::path> policy_path;

    /// Requested profile, after SANDBOX_PROFILE has been applied.
    std::string profile = std::string(kDefaultProfileName);

    /// Root under which `.claude/sandbox_policy.json` is looked up.
    std::filesystem::path project_root;

    /// SANDBOX_ENABLED; combined with the profile's own flag.
    bool sandbox_enabled = true;

    /// Directory for generated seatbelt profiles (macOS).
    std::filesystem::path profile_dir;

    std::string log_level = "info";
};

/// Parses a canonical boolean flag ("true"/"yes"/"1"/"y"/"on" and their
/// falsy counterparts), case-insensitively. Returns nullopt otherwise.
auto parse_bool_flag(std::string_view value) -> std::optional<bool>;

/// Builds an EnforcerConfig from SANDBOX_PROFILE, SANDBOX_ENABLED and
/// CMDGUARD_LOG_LEVEL. An explicit `profile` wins over SANDBOX_PROFILE.
auto load_enforcer_config_from_env(
    std::optional<std::filesystem::path> policy_path = std::nullopt,
    std::optional<std::string> profile = std::nullopt) -> EnforcerConfig;

} // namespace cmdguard
