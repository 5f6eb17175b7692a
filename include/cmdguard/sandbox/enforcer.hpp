#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "cmdguard/audit/audit_sink.hpp"
#include "cmdguard/core/config.hpp"
#include "cmdguard/core/error.hpp"
#include "cmdguard/policy/store.hpp"
#include "cmdguard/sandbox/argument_builder.hpp"
#include "cmdguard/sandbox/binary_resolver.hpp"
#include "cmdguard/sandbox/circuit_breaker.hpp"
#include "cmdguard/sandbox/injection.hpp"
#include "cmdguard/sandbox/types.hpp"

namespace cmdguard::sandbox {

/// Policy-driven gatekeeper for shell commands.
///
/// Classifies commands as SAFE, BLOCKED or NEEDS_APPROVAL and builds the
/// sandbox-wrapped argument vector for commands the caller decides to run.
/// The policy is resolved once in create() and never reloaded.
///
/// An instance owns its circuit breaker and is meant for one logical
/// workflow on one thread at a time.
class SandboxEnforcer {
public:
    /// Resolves the policy and the sandbox binary. Fails with
    /// PolicyValidation only for a malformed explicitly supplied policy.
    /// A null `sink` logs audit events; a null `resolver` uses the host OS.
    static auto create(const EnforcerConfig& config,
                       std::shared_ptr<audit::AuditSink> sink = nullptr,
                       std::unique_ptr<SandboxBinaryResolver> resolver = nullptr)
        -> Result<SandboxEnforcer>;

    /// Classifies one command. Never throws; emits exactly one audit event,
    /// plus an error event when this call trips the circuit breaker.
    ///
    /// An empty or blank command is NEEDS_APPROVAL with reason "Empty
    /// command" and leaves the breaker untouched. Its `can_sandbox` is
    /// sandbox_available(), not a constant true: a command that cannot be
    /// wrapped on this host is never reported as sandboxable.
    auto classify(std::string_view command) -> ClassificationResult;

    /// Argument vector to execute `command` within `boundaries`. A plain
    /// shell-word split when sandboxing is disabled or unavailable.
    [[nodiscard]] auto build_sandbox_args(std::string_view command,
                                          const Boundaries& boundaries) const
        -> Result<std::vector<std::string>>;

    [[nodiscard]] auto breaker_state() const noexcept -> CircuitBreakerState { return breaker_.state(); }
    [[nodiscard]] auto active_profile() const noexcept -> const std::string& { return loaded_.active_profile; }
    [[nodiscard]] auto profile() const noexcept -> const policy::ProfileConfig& { return loaded_.profile; }
    [[nodiscard]] auto policy_source() const noexcept -> policy::PolicySource { return loaded_.source; }
    [[nodiscard]] auto policy_path() const noexcept -> const std::optional<std::filesystem::path>& { return loaded_.path; }
    [[nodiscard]] auto sandbox_binary() const noexcept -> const ResolvedBinary& { return builder_.binary(); }
    [[nodiscard]] auto sandbox_enabled() const noexcept -> bool { return sandbox_enabled_; }

    /// True when approved commands can actually be wrapped on this host.
    [[nodiscard]] auto sandbox_available() const noexcept -> bool {
        return sandbox_enabled_ && builder_.binary().kind != SandboxBinary::None;
    }

private:
    struct BlockedPattern {
        std::string source;
        std::optional<std::regex> regex;  // nullopt: not a valid regex, substring match
    };

    /// Verdict of the policy rules alone, before the breaker is applied.
    struct RuleOutcome {
        Classification classification;
        std::optional<std::string> reason;
    };

    SandboxEnforcer(policy::LoadedPolicy loaded, bool sandbox_enabled,
                    ResolvedBinary binary, std::filesystem::path profile_dir,
                    std::shared_ptr<audit::AuditSink> sink);

    [[nodiscard]] auto evaluate_rules(std::string_view command) const -> RuleOutcome;
    [[nodiscard]] auto match_blocked_pattern(std::string_view command) const
        -> std::optional<std::string>;
    [[nodiscard]] auto match_safe_command(std::string_view trimmed) const -> bool;

    auto finish(std::string_view command, ClassificationResult result) -> ClassificationResult;
    void emit(std::string_view event_type, std::string_view command, audit::Severity severity,
              std::string reason, std::string_view classification);

    policy::LoadedPolicy loaded_;
    bool sandbox_enabled_;
    InjectionDetector detector_;
    CircuitBreaker breaker_;
    ArgumentBuilder builder_;
    std::vector<BlockedPattern> blocked_patterns_;
    std::shared_ptr<audit::AuditSink> sink_;
};

} // namespace cmdguard::sandbox
