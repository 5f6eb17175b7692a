#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "cmdguard/core/error.hpp"
#include "cmdguard/sandbox/enforcer.hpp"

namespace cmdguard::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitBlocked = 2;
inline constexpr int kExitNeedsApproval = 3;

/// Options shared by every subcommand.
struct GlobalOptions {
    std::string policy_path;
    std::string profile;
    std::string project_root;
    std::string log_level = "info";
    std::string audit_log;
};

/// Exit code reported for a classification.
auto exit_code_for(sandbox::Classification classification) -> int;

/// Builds an enforcer from the global options and the environment.
auto make_enforcer(const GlobalOptions& options) -> Result<sandbox::SandboxEnforcer>;

/// Register the `classify` subcommand.
/// Prints the classification of a command as JSON.
void register_classify_command(CLI::App& app, GlobalOptions& options, int& exit_code);

/// Register the `wrap` subcommand.
/// Prints the sandbox argument vector for an allowed command.
void register_wrap_command(CLI::App& app, GlobalOptions& options, int& exit_code);

/// Register the `validate` subcommand.
/// Lints a policy document before it is installed.
void register_validate_command(CLI::App& app, int& exit_code);

/// Register the `which` subcommand.
/// Prints the sandbox binary detected on this host.
void register_which_command(CLI::App& app, int& exit_code);

} // namespace cmdguard::cli
