#include "cmdguard/audit/audit_sink.hpp"

#include "cmdguard/core/logger.hpp"
#include "cmdguard/core/utils.hpp"

#include <spdlog/sinks/basic_file_sink.h>

namespace cmdguard::audit {

auto severity_to_string(Severity severity) -> std::string_view {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "info";
    }
}

auto severity_to_status(Severity severity) -> std::string_view {
    switch (severity) {
        case Severity::Info: return "success";
        case Severity::Warning: return "warning";
        case Severity::Error: return "failure";
        default: return "success";
    }
}

void to_json(json& j, const AuditEvent& event) {
    j = json{
        {"timestamp", event.timestamp.empty() ? utils::timestamp_iso() : event.timestamp},
        {"event_type", event.event_type},
        {"status", std::string(severity_to_status(event.severity))},
        {"context", {
            {"operation", event.operation},
            {"command", event.command},
            {"severity", std::string(severity_to_string(event.severity))},
            {"reason", event.reason},
            {"classification", event.classification},
            {"profile", event.profile},
        }},
    };
}

auto to_json_line(const AuditEvent& event) -> std::string {
    return json(event).dump(-1, ' ', false, json::error_handler_t::replace);
}

void LogAuditSink::record(const AuditEvent& event) {
    auto line = to_json_line(event);
    switch (event.severity) {
        case Severity::Info:
            LOG_INFO("audit {}", line);
            break;
        case Severity::Warning:
            LOG_WARN("audit {}", line);
            break;
        case Severity::Error:
            LOG_ERROR("audit {}", line);
            break;
    }
}

auto FileAuditSink::open(const std::filesystem::path& path)
    -> Result<std::shared_ptr<FileAuditSink>> {
    auto name = "audit:" + path.string();
    try {
        auto logger = spdlog::get(name);
        if (!logger) {
            logger = spdlog::basic_logger_mt(name, path.string());
            logger->set_pattern("%v");
            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::trace);
        }
        return std::make_shared<FileAuditSink>(Token{}, std::move(logger));
    } catch (const spdlog::spdlog_ex& e) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot open audit log", path.string() + ": " + e.what()));
    }
}

void FileAuditSink::record(const AuditEvent& event) {
    logger_->info(to_json_line(event));
}

} // namespace cmdguard::audit
