#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "cmdguard/core/error.hpp"

namespace cmdguard::audit {

using json = nlohmann::json;

enum class Severity {
    Info,
    Warning,
    Error,
};

auto severity_to_string(Severity severity) -> std::string_view;

/// Audit status recorded alongside the severity: "success", "warning" or
/// "failure".
auto severity_to_status(Severity severity) -> std::string_view;

inline constexpr std::string_view kClassificationEvent = "sandbox_classification";
inline constexpr std::string_view kCircuitBreakerEvent = "sandbox_circuit_breaker";

/// One security decision.
struct AuditEvent {
    std::string event_type = std::string(kClassificationEvent);
    std::string operation = "classify";
    std::string command;
    Severity severity = Severity::Info;
    std::string reason;
    std::string classification;
    std::string profile;
    std::string timestamp;
};

/// {"timestamp", "event_type", "status", "context": {...}}
void to_json(json& j, const AuditEvent& event);

/// Serialises an event to a single line. Invalid UTF-8 in the command is
/// replaced rather than rejected.
auto to_json_line(const AuditEvent& event) -> std::string;

/// Receives one event per classification decision.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void record(const AuditEvent& event) = 0;
};

/// Writes events through the application logger at the matching level.
class LogAuditSink final : public AuditSink {
public:
    void record(const AuditEvent& event) override;
};

/// Appends events as JSON lines to a file.
class FileAuditSink final : public AuditSink {
    struct Token {};

public:
    static auto open(const std::filesystem::path& path) -> Result<std::shared_ptr<FileAuditSink>>;

    /// Only reachable through open().
    FileAuditSink(Token, std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

    void record(const AuditEvent& event) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cmdguard::audit
