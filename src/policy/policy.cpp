#include "cmdguard/policy/policy.hpp"

#include <limits>

namespace cmdguard::policy {

namespace {

constexpr const char* kBundledPolicyJson = R"json({
    "version": "1.0.0",
    "profiles": {
        "development": {
            "safe_commands": [
                "cat", "echo", "grep", "ls", "pwd", "which",
                "git status", "git diff", "git log",
                "pytest", "python -m pytest"
            ],
            "blocked_patterns": [
                "rm -rf", "sudo", "git push --force", "\\beval\\b",
                "chmod 777", "dd if=", ">\\s*/dev/sd"
            ],
            "sandbox_enabled": true,
            "circuit_breaker": {"enabled": true, "threshold": 10}
        },
        "testing": {
            "safe_commands": ["cat", "ls", "pwd", "pytest", "python -m pytest"],
            "blocked_patterns": [
                "rm -rf", "sudo", "git push --force", "\\beval\\b",
                "chmod 777", "dd if=", ">\\s*/dev/sd"
            ],
            "sandbox_enabled": true,
            "circuit_breaker": {"enabled": true, "threshold": 5}
        },
        "production": {
            "safe_commands": ["cat", "ls", "pwd"],
            "blocked_patterns": [
                "rm -rf", "sudo", "git push --force", "\\beval\\b",
                "chmod 777", "dd if=", ">\\s*/dev/sd"
            ],
            "sandbox_enabled": true,
            "circuit_breaker": {"enabled": true, "threshold": 3}
        }
    },
    "default_profile": "development"
})json";

auto invalid(std::string field, std::string detail) -> VoidResult {
    return std::unexpected(make_error(ErrorCode::PolicyValidation,
        "Invalid policy field '" + field + "'", std::move(detail)));
}

auto check_string_array(const json& obj, std::string_view key, std::string_view where,
                        bool required) -> VoidResult {
    auto field = std::string(where) + "." + std::string(key);
    auto it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null()) {
        if (required) return invalid(field, "required field is missing");
        return {};
    }
    if (!it->is_array()) {
        return invalid(field, "expected an array of strings");
    }
    for (size_t i = 0; i < it->size(); ++i) {
        if (!(*it)[i].is_string()) {
            return invalid(field + "[" + std::to_string(i) + "]", "expected a string");
        }
    }
    return {};
}

} // namespace

auto validate(const json& profile) -> bool {
    if (!profile.is_object()) return false;
    if (!profile.contains("safe_commands") || !profile["safe_commands"].is_array()) return false;
    if (!profile.contains("blocked_patterns") || !profile["blocked_patterns"].is_array()) return false;
    if (!profile.contains("sandbox_enabled") || !profile["sandbox_enabled"].is_boolean()) return false;
    return true;
}

auto validate_profile(const json& profile, std::string_view where) -> VoidResult {
    if (!profile.is_object()) {
        return invalid(std::string(where), "expected an object");
    }

    if (auto r = check_string_array(profile, "safe_commands", where, true); !r) return r;
    if (auto r = check_string_array(profile, "blocked_patterns", where, true); !r) return r;

    auto sandbox_field = std::string(where) + ".sandbox_enabled";
    if (!profile.contains("sandbox_enabled")) {
        return invalid(sandbox_field, "required field is missing");
    }
    if (!profile["sandbox_enabled"].is_boolean()) {
        return invalid(sandbox_field, "expected a boolean");
    }

    if (auto it = profile.find("circuit_breaker"); it != profile.end() && !it->is_null()) {
        auto cb_field = std::string(where) + ".circuit_breaker";
        if (!it->is_object()) {
            return invalid(cb_field, "expected an object");
        }
        if (it->contains("enabled") && !(*it)["enabled"].is_boolean()) {
            return invalid(cb_field + ".enabled", "expected a boolean");
        }
        if (it->contains("threshold")) {
            const auto& threshold = (*it)["threshold"];
            if (!threshold.is_number_integer() || threshold.get<int64_t>() < 0) {
                return invalid(cb_field + ".threshold", "expected a non-negative integer");
            }
            if (threshold.get<int64_t>() > std::numeric_limits<int>::max()) {
                return invalid(cb_field + ".threshold", "exceeds the largest supported threshold");
            }
        }
    }

    for (auto key : {"shell_injection_patterns", "path_traversal_patterns", "blocked_paths"}) {
        if (auto r = check_string_array(profile, key, where, false); !r) return r;
    }

    return {};
}

auto validate_policy_document(const json& document) -> VoidResult {
    if (!document.is_object()) {
        return invalid("<root>", "policy document must be a JSON object");
    }
    if (!document.contains("profiles")) {
        return invalid("profiles", "required field is missing");
    }
    const auto& profiles = document["profiles"];
    if (!profiles.is_object()) {
        return invalid("profiles", "expected an object keyed by profile name");
    }

    for (const auto& [name, profile] : profiles.items()) {
        if (auto r = validate_profile(profile, "profiles." + name); !r) return r;
    }

    if (auto it = document.find("default_profile"); it != document.end()) {
        if (!it->is_string()) {
            return invalid("default_profile", "expected a string");
        }
        auto name = it->get<std::string>();
        if (!profiles.contains(name)) {
            return invalid("default_profile", "profile '" + name + "' is not defined");
        }
    }

    if (auto it = document.find("version"); it != document.end() && !it->is_string()) {
        return invalid("version", "expected a string");
    }

    return {};
}

auto parse_policy(const json& document) -> Result<Policy> {
    if (auto r = validate_policy_document(document); !r) {
        return std::unexpected(r.error());
    }
    try {
        return document.get<Policy>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::PolicyValidation,
            "Policy document could not be converted", e.what()));
    }
}

auto bundled_policy_document() -> const json& {
    static const json document = json::parse(kBundledPolicyJson);
    return document;
}

auto bundled_policy() -> Policy {
    return bundled_policy_document().get<Policy>();
}

} // namespace cmdguard::policy
