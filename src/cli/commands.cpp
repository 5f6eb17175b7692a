#include "cmdguard/cli/commands.hpp"
#include "cmdguard/core/config.hpp"
#include "cmdguard/core/logger.hpp"
#include "cmdguard/policy/store.hpp"
#include "cmdguard/sandbox/binary_resolver.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

namespace cmdguard::cli {

using json = nlohmann::json;

namespace {

auto join_words(const std::vector<std::string>& words) -> std::string {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

auto dump(const json& j) -> std::string {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

auto host_os_name(sandbox::HostOs os) -> std::string {
    switch (os) {
        case sandbox::HostOs::Linux: return "linux";
        case sandbox::HostOs::Darwin: return "darwin";
        case sandbox::HostOs::Windows: return "windows";
        default: return "other";
    }
}

struct WrapArgs {
    std::vector<std::string> words;
    std::vector<std::string> read_only;
    std::vector<std::string> read_write;
    bool network = false;
};

} // anonymous namespace

auto exit_code_for(sandbox::Classification classification) -> int {
    switch (classification) {
        case sandbox::Classification::Safe: return kExitOk;
        case sandbox::Classification::Blocked: return kExitBlocked;
        case sandbox::Classification::NeedsApproval: return kExitNeedsApproval;
        default: return kExitError;
    }
}

auto make_enforcer(const GlobalOptions& options) -> Result<sandbox::SandboxEnforcer> {
    Logger::init("cmdguard", options.log_level);

    std::optional<std::filesystem::path> policy_path;
    if (!options.policy_path.empty()) {
        policy_path = options.policy_path;
    }
    std::optional<std::string> profile;
    if (!options.profile.empty()) {
        profile = options.profile;
    }

    auto config = load_enforcer_config_from_env(policy_path, profile);
    if (!options.project_root.empty()) {
        config.project_root = options.project_root;
    }

    std::shared_ptr<audit::AuditSink> sink;
    if (!options.audit_log.empty()) {
        auto file_sink = audit::FileAuditSink::open(options.audit_log);
        if (!file_sink) {
            return std::unexpected(file_sink.error());
        }
        sink = *file_sink;
    }

    return sandbox::SandboxEnforcer::create(config, std::move(sink));
}

// ---------------------------------------------------------------------------
// classify command
// ---------------------------------------------------------------------------

void register_classify_command(CLI::App& app, GlobalOptions& options, int& exit_code) {
    auto* sub = app.add_subcommand("classify", "Classify a command as safe, blocked or needs_approval");

    auto words = std::make_shared<std::vector<std::string>>();
    sub->add_option("command", *words, "Command to classify (put it after --)")
        ->required()
        ->expected(-1);

    sub->callback([&options, &exit_code, words]() {
        auto enforcer = make_enforcer(options);
        if (!enforcer) {
            std::cerr << "error: " << enforcer.error().what() << "\n";
            exit_code = kExitError;
            return;
        }

        auto result = enforcer->classify(join_words(*words));
        std::cout << dump(json(result)) << "\n";
        exit_code = exit_code_for(result.classification);
    });
}

// ---------------------------------------------------------------------------
// wrap command
// ---------------------------------------------------------------------------

void register_wrap_command(CLI::App& app, GlobalOptions& options, int& exit_code) {
    auto* sub = app.add_subcommand("wrap", "Print the sandboxed argument vector for a command");

    auto args = std::make_shared<WrapArgs>();
    sub->add_option("--ro", args->read_only, "Read-only bind path (repeatable)");
    sub->add_option("--rw", args->read_write, "Read-write bind path (repeatable)");
    sub->add_flag("--network", args->network, "Allow network access");
    sub->add_option("command", args->words, "Command to wrap (put it after --)")
        ->required()
        ->expected(-1);

    sub->callback([&options, &exit_code, args]() {
        auto enforcer = make_enforcer(options);
        if (!enforcer) {
            std::cerr << "error: " << enforcer.error().what() << "\n";
            exit_code = kExitError;
            return;
        }

        auto command = join_words(args->words);
        auto result = enforcer->classify(command);
        if (result.classification == sandbox::Classification::Blocked) {
            std::cout << dump(json(result)) << "\n";
            exit_code = kExitBlocked;
            return;
        }

        sandbox::Boundaries boundaries{args->read_only, args->read_write, args->network};
        auto argv = enforcer->build_sandbox_args(command, boundaries);
        if (!argv) {
            std::cerr << "error: " << argv.error().what() << "\n";
            exit_code = kExitError;
            return;
        }

        std::cout << dump(json(*argv)) << "\n";
        exit_code = kExitOk;
    });
}

// ---------------------------------------------------------------------------
// validate command
// ---------------------------------------------------------------------------

void register_validate_command(CLI::App& app, int& exit_code) {
    auto* sub = app.add_subcommand("validate", "Validate a sandbox policy file");

    auto path = std::make_shared<std::string>();
    sub->add_option("file", *path, "Policy file (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    sub->callback([&exit_code, path]() {
        auto document = policy::read_policy_file(*path);
        if (!document) {
            std::cout << "invalid: " << document.error().what() << "\n";
            exit_code = kExitError;
            return;
        }

        auto valid = policy::validate_policy_document(*document);
        if (!valid) {
            std::cout << "invalid: " << valid.error().what() << "\n";
            exit_code = kExitError;
            return;
        }

        std::cout << "ok\n";
        exit_code = kExitOk;
    });
}

// ---------------------------------------------------------------------------
// which command
// ---------------------------------------------------------------------------

void register_which_command(CLI::App& app, int& exit_code) {
    auto* sub = app.add_subcommand("which", "Show the sandbox binary available on this host");

    sub->callback([&exit_code]() {
        auto os = sandbox::detect_host_os();
        auto binary = sandbox::resolve_sandbox_binary(os, sandbox::find_executable_on_path);

        json out = {
            {"os", host_os_name(os)},
            {"binary", binary.kind},
            {"path", binary.path.string()},
        };
        std::cout << dump(out) << "\n";
        exit_code = kExitOk;
    });
}

} // namespace cmdguard::cli
