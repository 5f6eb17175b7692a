#include "cmdguard/sandbox/argument_builder.hpp"

#include "cmdguard/core/logger.hpp"
#include "cmdguard/core/utils.hpp"

#include <fstream>
#include <set>

namespace cmdguard::sandbox {

namespace fs = std::filesystem;

namespace {

// Read access every seatbelt profile needs to start a process at all.
constexpr std::string_view kSystemReadPaths[] = {
    "/usr", "/bin", "/sbin", "/System", "/Library", "/private/etc", "/dev",
};

auto sbpl_quote(std::string_view s) -> std::string {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

/// Non-empty entries in order, first occurrence only.
auto unique_paths(const std::vector<std::string>& paths) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& p : paths) {
        if (p.empty()) {
            LOG_DEBUG("ArgumentBuilder: ignoring empty boundary path");
            continue;
        }
        if (seen.insert(p).second) {
            out.push_back(p);
        }
    }
    return out;
}

auto profile_subpath(const std::string& path) -> std::string {
    auto canonical = ArgumentBuilder::canonicalize_boundary_path(path);
    if (!canonical) {
        LOG_DEBUG("ArgumentBuilder: keeping {} as given ({})", path, canonical.error().what());
        return sbpl_quote(path);
    }
    return sbpl_quote(canonical->string());
}

} // namespace

ArgumentBuilder::ArgumentBuilder(ResolvedBinary binary, fs::path profile_dir)
    : binary_(std::move(binary)), profile_dir_(std::move(profile_dir)) {}

auto ArgumentBuilder::build(std::string_view command, const Boundaries& boundaries) const
    -> Result<std::vector<std::string>> {
    auto words = utils::split_shell_words(command);

    switch (binary_.kind) {
        case SandboxBinary::Bwrap:
            return build_bwrap(std::move(words), boundaries);
        case SandboxBinary::SandboxExec:
            return build_sandbox_exec(std::move(words), boundaries);
        case SandboxBinary::None:
        default:
            return words;
    }
}

auto ArgumentBuilder::build_bwrap(std::vector<std::string> command,
                                  const Boundaries& boundaries) const
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.push_back(binary_.path.string());

    for (const auto& path : unique_paths(boundaries.read_only)) {
        args.insert(args.end(), {"--ro-bind", path, path});
    }
    for (const auto& path : unique_paths(boundaries.read_write)) {
        args.insert(args.end(), {"--bind", path, path});
    }
    if (!boundaries.network) {
        args.emplace_back("--unshare-net");
    }

    args.insert(args.end(), std::make_move_iterator(command.begin()),
                std::make_move_iterator(command.end()));
    return args;
}

auto ArgumentBuilder::build_sandbox_exec(std::vector<std::string> command,
                                         const Boundaries& boundaries) const
    -> Result<std::vector<std::string>> {
    auto profile = render_seatbelt_profile(boundaries);
    auto profile_path = write_profile(profile);
    if (!profile_path) {
        return std::unexpected(profile_path.error());
    }

    std::vector<std::string> args = {binary_.path.string(), "-f", profile_path->string()};
    args.insert(args.end(), std::make_move_iterator(command.begin()),
                std::make_move_iterator(command.end()));
    return args;
}

auto ArgumentBuilder::render_seatbelt_profile(const Boundaries& boundaries) -> std::string {
    std::string out;
    out += "(version 1)\n";
    out += "(deny default)\n";
    out += "(allow process-exec)\n";
    out += "(allow process-fork)\n";
    out += "(allow signal (target self))\n";
    out += "(allow sysctl-read)\n";
    out += "(allow file-read-metadata)\n";

    out += "(allow file-read*";
    for (auto path : kSystemReadPaths) {
        out += "\n    (subpath " + sbpl_quote(path) + ")";
    }
    out += ")\n";

    auto read_only = unique_paths(boundaries.read_only);
    if (!read_only.empty()) {
        out += "(allow file-read*";
        for (const auto& path : read_only) {
            out += "\n    (subpath " + profile_subpath(path) + ")";
        }
        out += ")\n";
    }

    auto read_write = unique_paths(boundaries.read_write);
    if (!read_write.empty()) {
        out += "(allow file-read* file-write*";
        for (const auto& path : read_write) {
            out += "\n    (subpath " + profile_subpath(path) + ")";
        }
        out += ")\n";
    }

    if (boundaries.network) {
        out += "(allow network*)\n";
    }
    return out;
}

auto ArgumentBuilder::seatbelt_profile_path(std::string_view profile) const -> fs::path {
    return profile_dir_ / ("cmdguard-" + utils::sha256(profile).substr(0, 16) + ".sb");
}

auto ArgumentBuilder::write_profile(std::string_view profile) const -> Result<fs::path> {
    auto path = seatbelt_profile_path(profile);

    // Content-addressed: an existing file already holds this profile.
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return path;
    }

    fs::create_directories(profile_dir_, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot create seatbelt profile directory", profile_dir_.string() + ": " + ec.message()));
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot write seatbelt profile", path.string()));
    }
    out << profile;
    out.close();
    if (out.fail()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed writing seatbelt profile", path.string()));
    }

    LOG_DEBUG("ArgumentBuilder: wrote seatbelt profile {}", path.string());
    return path;
}

auto ArgumentBuilder::canonicalize_boundary_path(const fs::path& path) -> Result<fs::path> {
    std::error_code ec;

    if (fs::exists(path, ec)) {
        auto canonical = fs::canonical(path, ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to canonicalize path", path.string() + ": " + ec.message()));
        }
        return canonical;
    }

    // Walk up to the nearest existing ancestor
    auto current = path;
    auto leaf = fs::path{};
    while (!current.empty() && !fs::exists(current, ec)) {
        leaf = leaf.empty() ? current.filename() : current.filename() / leaf;
        auto parent = current.parent_path();
        if (parent == current) break;
        current = parent;
    }

    if (current.empty() || !fs::exists(current, ec)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "No existing ancestor found for boundary path", path.string()));
    }

    auto canonical_ancestor = fs::canonical(current, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to canonicalize ancestor", current.string()));
    }

    return canonical_ancestor / leaf;
}

} // namespace cmdguard::sandbox
