#include "cmdguard/sandbox/types.hpp"

namespace cmdguard::sandbox {

auto classification_to_string(Classification c) -> std::string_view {
    switch (c) {
        case Classification::Safe: return "safe";
        case Classification::Blocked: return "blocked";
        case Classification::NeedsApproval: return "needs_approval";
        default: return "unknown";
    }
}

auto sandbox_binary_to_string(SandboxBinary b) -> std::string_view {
    switch (b) {
        case SandboxBinary::Bwrap: return "bwrap";
        case SandboxBinary::SandboxExec: return "sandbox-exec";
        case SandboxBinary::None: return "none";
        default: return "none";
    }
}

void to_json(json& j, const ClassificationResult& r) {
    j = json{
        {"classification", r.classification},
        {"can_sandbox", r.can_sandbox},
    };
    if (r.reason.has_value()) {
        j["reason"] = *r.reason;
    } else {
        j["reason"] = nullptr;
    }
}

} // namespace cmdguard::sandbox
