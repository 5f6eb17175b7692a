#include "cmdguard/core/config.hpp"
#include "cmdguard/core/logger.hpp"
#include "cmdguard/core/utils.hpp"

#include <cstdlib>

namespace cmdguard {

auto parse_bool_flag(std::string_view value) -> std::optional<bool> {
    auto v = utils::to_lower(utils::trim(value));
    if (v == "true" || v == "yes" || v == "1" || v == "y" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "n" || v == "off") return false;
    return std::nullopt;
}

auto load_enforcer_config_from_env(std::optional<std::filesystem::path> policy_path,
                                   std::optional<std::string> profile) -> EnforcerConfig {
    EnforcerConfig config;
    config.policy_path = std::move(policy_path);

    if (profile.has_value()) {
        config.profile = std::move(*profile);
    } else if (auto* val = std::getenv("SANDBOX_PROFILE")) {
        auto trimmed = utils::trim(val);
        if (!trimmed.empty()) {
            config.profile = std::move(trimmed);
        }
    }

    if (auto* val = std::getenv("SANDBOX_ENABLED")) {
        if (auto flag = parse_bool_flag(val)) {
            config.sandbox_enabled = *flag;
        } else {
            LOG_WARN("Config: unrecognised SANDBOX_ENABLED value '{}', keeping sandbox enabled", val);
        }
    }

    if (auto* val = std::getenv("CMDGUARD_LOG_LEVEL")) {
        config.log_level = val;
    }

    std::error_code ec;
    config.project_root = std::filesystem::current_path(ec);
    if (ec) {
        LOG_WARN("Config: cannot determine working directory ({}), using '.'", ec.message());
        config.project_root = ".";
    }

    config.profile_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        config.profile_dir = "/tmp";
    }

    return config;
}

} // namespace cmdguard
