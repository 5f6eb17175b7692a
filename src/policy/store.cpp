#include "cmdguard/policy/store.hpp"

#include "cmdguard/core/logger.hpp"

#include <fstream>

namespace cmdguard::policy {

namespace fs = std::filesystem;

namespace {

auto finish(Policy policy, std::string_view profile_name, PolicySource source,
            std::optional<fs::path> path) -> Result<LoadedPolicy> {
    auto selected = select_profile(policy, profile_name);
    if (!selected) {
        return std::unexpected(selected.error());
    }

    LoadedPolicy loaded;
    loaded.active_profile = std::move(selected->first);
    loaded.profile = std::move(selected->second);
    loaded.policy = std::move(policy);
    loaded.source = source;
    loaded.path = std::move(path);

    LOG_INFO("Policy: using {} policy{} (profile '{}')",
             policy_source_to_string(loaded.source),
             loaded.path ? " from " + loaded.path->string() : std::string{},
             loaded.active_profile);
    return loaded;
}

auto load_bundled(std::string_view profile_name) -> Result<LoadedPolicy> {
    return finish(bundled_policy(), profile_name, PolicySource::Bundled, std::nullopt);
}

} // namespace

auto policy_source_to_string(PolicySource source) -> std::string_view {
    switch (source) {
        case PolicySource::Explicit: return "explicit";
        case PolicySource::ProjectRoot: return "project";
        case PolicySource::ProjectConfig: return "project-config";
        case PolicySource::Bundled: return "bundled";
        default: return "unknown";
    }
}

auto cascade_candidates(const fs::path& project_root) -> std::vector<fs::path> {
    return {
        project_root / ".claude" / "sandbox_policy.json",
        project_root / ".claude" / "config" / "sandbox_policy.json",
    };
}

auto read_policy_file(const fs::path& path) -> Result<json> {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Policy file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Cannot open policy file", path.string()));
    }

    try {
        return json::parse(file);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Corrupt policy file", path.string() + ": " + e.what()));
    }
}

auto select_profile(const Policy& policy, std::string_view requested)
    -> Result<std::pair<std::string, ProfileConfig>> {
    if (auto it = policy.profiles.find(std::string(requested)); it != policy.profiles.end()) {
        return std::pair{it->first, it->second};
    }

    auto it = policy.profiles.find(policy.default_profile);
    if (it == policy.profiles.end()) {
        return std::unexpected(make_error(ErrorCode::PolicyValidation,
            "Invalid policy field 'default_profile'",
            "profile '" + policy.default_profile + "' is not defined"));
    }

    LOG_INFO("Policy: profile '{}' not found, falling back to default profile '{}'",
             requested, policy.default_profile);
    return std::pair{it->first, it->second};
}

auto load_policy(const std::optional<fs::path>& explicit_path,
                 std::string_view profile_name,
                 const fs::path& project_root) -> Result<LoadedPolicy> {
    if (explicit_path.has_value()) {
        auto document = read_policy_file(*explicit_path);
        if (!document) {
            if (document.error().code() == ErrorCode::NotFound) {
                LOG_INFO("Policy: {} does not exist, using bundled policy",
                         explicit_path->string());
            } else {
                LOG_WARN("Policy: {}, using bundled policy", document.error().what());
            }
            return load_bundled(profile_name);
        }

        auto parsed = parse_policy(*document);
        if (!parsed) {
            LOG_ERROR("Policy: {} rejected: {}", explicit_path->string(), parsed.error().what());
            return std::unexpected(parsed.error());
        }
        return finish(std::move(*parsed), profile_name, PolicySource::Explicit, *explicit_path);
    }

    auto candidates = cascade_candidates(project_root);
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];
        auto document = read_policy_file(candidate);
        if (!document) {
            if (document.error().code() != ErrorCode::NotFound) {
                LOG_WARN("Policy: skipping {}", document.error().what());
            } else {
                LOG_DEBUG("Policy: no candidate at {}", candidate.string());
            }
            continue;
        }

        auto parsed = parse_policy(*document);
        if (!parsed) {
            LOG_WARN("Policy: skipping {}: {}", candidate.string(), parsed.error().what());
            continue;
        }

        auto source = i == 0 ? PolicySource::ProjectRoot : PolicySource::ProjectConfig;
        auto loaded = finish(std::move(*parsed), profile_name, source, candidate);
        if (!loaded) {
            LOG_WARN("Policy: skipping {}: {}", candidate.string(), loaded.error().what());
            continue;
        }
        return loaded;
    }

    return load_bundled(profile_name);
}

} // namespace cmdguard::policy
