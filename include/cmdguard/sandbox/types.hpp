#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cmdguard::sandbox {

using json = nlohmann::json;

enum class Classification {
    Safe,
    Blocked,
    NeedsApproval,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Classification, {
    {Classification::Safe, "safe"},
    {Classification::Blocked, "blocked"},
    {Classification::NeedsApproval, "needs_approval"},
})

auto classification_to_string(Classification c) -> std::string_view;

/// Verdict for one command. `reason` is always set for Blocked and never
/// for Safe.
struct ClassificationResult {
    Classification classification = Classification::NeedsApproval;
    std::optional<std::string> reason;
    bool can_sandbox = false;
};

void to_json(json& j, const ClassificationResult& r);

enum class SandboxBinary {
    Bwrap,        // Linux bubblewrap
    SandboxExec,  // macOS seatbelt
    None,
};

NLOHMANN_JSON_SERIALIZE_ENUM(SandboxBinary, {
    {SandboxBinary::Bwrap, "bwrap"},
    {SandboxBinary::SandboxExec, "sandbox-exec"},
    {SandboxBinary::None, "none"},
})

auto sandbox_binary_to_string(SandboxBinary b) -> std::string_view;

/// The wrapper usable on this host, with its absolute path when found.
struct ResolvedBinary {
    SandboxBinary kind = SandboxBinary::None;
    std::filesystem::path path;
};

/// Filesystem/network envelope for one sandboxed invocation.
struct Boundaries {
    std::vector<std::string> read_only;
    std::vector<std::string> read_write;
    bool network = false;
};

enum class HostOs {
    Linux,
    Darwin,
    Windows,
    Other,
};

} // namespace cmdguard::sandbox
