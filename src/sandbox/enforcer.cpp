#include "cmdguard/sandbox/enforcer.hpp"

#include "cmdguard/core/logger.hpp"
#include "cmdguard/core/utils.hpp"

namespace cmdguard::sandbox {

namespace {

constexpr std::string_view kEmptyReason = "Empty command";
constexpr std::string_view kUnknownReason = "Unknown command, not in safe or blocked lists";

auto detector_patterns_for(const policy::ProfileConfig& profile) -> DetectorPatterns {
    DetectorPatterns patterns;
    if (profile.shell_injection_patterns) {
        patterns.shell_injection = *profile.shell_injection_patterns;
    }
    if (profile.path_traversal_patterns) {
        patterns.path_traversal = *profile.path_traversal_patterns;
    }
    if (profile.blocked_paths) {
        patterns.blocked_paths = *profile.blocked_paths;
    }
    return patterns;
}

} // namespace

auto SandboxEnforcer::create(const EnforcerConfig& config,
                             std::shared_ptr<audit::AuditSink> sink,
                             std::unique_ptr<SandboxBinaryResolver> resolver)
    -> Result<SandboxEnforcer> {
    auto loaded = policy::load_policy(config.policy_path, config.profile, config.project_root);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    if (!resolver) {
        resolver = make_binary_resolver(detect_host_os());
    }
    auto binary = resolver->resolve();

    bool enabled = loaded->profile.sandbox_enabled && config.sandbox_enabled;
    if (!enabled) {
        LOG_INFO("Sandbox: disabled ({})",
                 config.sandbox_enabled ? "by profile" : "by SANDBOX_ENABLED");
    }

    if (!sink) {
        sink = std::make_shared<audit::LogAuditSink>();
    }

    auto profile_dir = config.profile_dir;
    if (profile_dir.empty()) {
        std::error_code ec;
        profile_dir = std::filesystem::temp_directory_path(ec);
        if (ec) profile_dir = "/tmp";
    }

    return SandboxEnforcer(std::move(*loaded), enabled, std::move(binary),
                           std::move(profile_dir), std::move(sink));
}

SandboxEnforcer::SandboxEnforcer(policy::LoadedPolicy loaded, bool sandbox_enabled,
                                 ResolvedBinary binary, std::filesystem::path profile_dir,
                                 std::shared_ptr<audit::AuditSink> sink)
    : loaded_(std::move(loaded)),
      sandbox_enabled_(sandbox_enabled),
      detector_(detector_patterns_for(loaded_.profile)),
      breaker_(policy::effective_breaker(loaded_.profile)),
      builder_(std::move(binary), std::move(profile_dir)),
      sink_(std::move(sink))
{
    for (const auto& source : loaded_.profile.blocked_patterns) {
        if (source.empty()) continue;
        BlockedPattern pattern{source, std::nullopt};
        try {
            pattern.regex = std::regex(source, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            LOG_WARN("Policy: blocked pattern '{}' is not a valid regex ({}), matching as text",
                     source, e.what());
        }
        blocked_patterns_.push_back(std::move(pattern));
    }
}

auto SandboxEnforcer::match_blocked_pattern(std::string_view command) const
    -> std::optional<std::string> {
    std::optional<std::string> lowered;

    for (const auto& pattern : blocked_patterns_) {
        if (pattern.regex.has_value()) {
            try {
                if (std::regex_search(command.begin(), command.end(), *pattern.regex)) {
                    return pattern.source;
                }
                continue;
            } catch (const std::regex_error& e) {
                LOG_WARN("Policy: blocked pattern '{}' failed to evaluate ({}), matching as text",
                         pattern.source, e.what());
            }
        }

        if (!lowered) lowered = utils::to_lower(command);
        if (lowered->find(utils::to_lower(pattern.source)) != std::string::npos) {
            return pattern.source;
        }
    }
    return std::nullopt;
}

auto SandboxEnforcer::match_safe_command(std::string_view trimmed) const -> bool {
    for (const auto& entry : loaded_.profile.safe_commands) {
        auto safe = utils::trim(entry);
        if (safe.empty() || !trimmed.starts_with(safe)) continue;
        if (trimmed.size() == safe.size()) return true;

        char next = trimmed[safe.size()];
        if (next == ' ' || next == '\t') return true;
    }
    return false;
}

auto SandboxEnforcer::evaluate_rules(std::string_view command) const -> RuleOutcome {
    if (auto finding = detector_.scan(command)) {
        return {Classification::Blocked, finding->reason};
    }

    if (auto pattern = match_blocked_pattern(command)) {
        return {Classification::Blocked, "Matched blocked pattern: " + *pattern};
    }

    if (match_safe_command(utils::trim(command))) {
        return {Classification::Safe, std::nullopt};
    }

    return {Classification::NeedsApproval, std::string(kUnknownReason)};
}

auto SandboxEnforcer::classify(std::string_view command) -> ClassificationResult {
    if (utils::is_blank(command)) {
        ClassificationResult result{Classification::NeedsApproval,
                                    std::string(kEmptyReason), sandbox_available()};
        return finish(command, std::move(result));
    }

    auto outcome = evaluate_rules(command);

    if (breaker_.is_open()) {
        if (outcome.classification == Classification::Safe) {
            breaker_.record_safe();
            LOG_INFO("CircuitBreaker: closed by safe command");
            return finish(command, {Classification::Safe, std::nullopt, sandbox_available()});
        }

        if (outcome.classification == Classification::Blocked) {
            breaker_.record_block();
        }
        auto reason = "Blocked by circuit breaker: open after " +
                      std::to_string(breaker_.consecutive_blocked()) +
                      " consecutive blocks (command would be: " +
                      outcome.reason.value_or("no decision") + ")";
        return finish(command, {Classification::Blocked, std::move(reason), false});
    }

    switch (outcome.classification) {
        case Classification::Blocked: {
            bool tripped = breaker_.record_block();
            auto reason = outcome.reason.value_or("Blocked");
            if (tripped) {
                reason = "Blocked by circuit breaker: tripped after " +
                         std::to_string(breaker_.consecutive_blocked()) +
                         " consecutive blocks (last: " + reason + ")";
            }
            auto result = finish(command, {Classification::Blocked, reason, false});
            if (tripped) {
                emit(audit::kCircuitBreakerEvent, command, audit::Severity::Error, reason,
                     classification_to_string(Classification::Blocked));
            }
            return result;
        }
        case Classification::Safe:
            breaker_.record_safe();
            return finish(command, {Classification::Safe, std::nullopt, sandbox_available()});
        case Classification::NeedsApproval:
        default:
            return finish(command, {Classification::NeedsApproval, std::move(outcome.reason),
                                    sandbox_available()});
    }
}

auto SandboxEnforcer::finish(std::string_view command, ClassificationResult result)
    -> ClassificationResult {
    auto label = classification_to_string(result.classification);
    auto reason = result.reason.value_or("");

    if (result.classification == Classification::Blocked) {
        LOG_WARN("BLOCKED command ({}): {}", reason, command);
        emit(audit::kClassificationEvent, command, audit::Severity::Warning, reason, label);
    } else {
        LOG_INFO("{} command: {}", result.classification == Classification::Safe
                                       ? "SAFE" : "NEEDS_APPROVAL", command);
        emit(audit::kClassificationEvent, command, audit::Severity::Info, reason, label);
    }
    return result;
}

void SandboxEnforcer::emit(std::string_view event_type, std::string_view command,
                           audit::Severity severity, std::string reason,
                           std::string_view classification) {
    audit::AuditEvent event;
    event.event_type = std::string(event_type);
    event.command = std::string(command);
    event.severity = severity;
    event.reason = std::move(reason);
    event.classification = std::string(classification);
    event.profile = loaded_.active_profile;
    event.timestamp = utils::timestamp_iso();
    sink_->record(event);
}

auto SandboxEnforcer::build_sandbox_args(std::string_view command,
                                         const Boundaries& boundaries) const
    -> Result<std::vector<std::string>> {
    if (!sandbox_enabled_) {
        LOG_DEBUG("Sandbox: disabled, passing command through");
        return utils::split_shell_words(command);
    }
    return builder_.build(command, boundaries);
}

} // namespace cmdguard::sandbox
