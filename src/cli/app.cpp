#include "cmdguard/cli/app.hpp"
#include "cmdguard/core/logger.hpp"

// Version string; injected by CMake via -DCMDGUARD_VERSION_STRING=...
#ifndef CMDGUARD_VERSION_STRING
#define CMDGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace cmdguard::cli {

App::App()
    : cli_("cmdguard", "Policy-driven command gatekeeper and sandbox wrapper")
{
    cli_.set_version_flag("--version", CMDGUARD_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-p,--policy", options_.policy_path,
                    "Sandbox policy file (JSON); cascade lookup when omitted");

    cli_.add_option("--profile", options_.profile,
                    "Policy profile (defaults to SANDBOX_PROFILE or 'development')");

    cli_.add_option("--project-root", options_.project_root,
                    "Directory searched for .claude/sandbox_policy.json")
        ->check(CLI::ExistingDirectory);

    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("CMDGUARD_LOG_LEVEL")
        ->default_val("info");

    cli_.add_option("--audit-log", options_.audit_log,
                    "Append audit events as JSON lines to this file");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already run inside parse().
    Logger::flush();
    return exit_code_;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_classify_command(cli_, options_, exit_code_);
    register_wrap_command(cli_, options_, exit_code_);
    register_validate_command(cli_, exit_code_);
    register_which_command(cli_, exit_code_);
}

} // namespace cmdguard::cli
