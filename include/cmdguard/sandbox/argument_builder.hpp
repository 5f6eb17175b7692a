#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "cmdguard/core/error.hpp"
#include "cmdguard/sandbox/types.hpp"

namespace cmdguard::sandbox {

/// Produces the argument vector that runs a command inside the resolved
/// sandbox binary. The command is always the trailing argument(s).
class ArgumentBuilder {
public:
    ArgumentBuilder(ResolvedBinary binary, std::filesystem::path profile_dir);

    /// bwrap:        <bwrap> [--ro-bind p p]... [--bind p p]... [--unshare-net] <cmd...>
    /// sandbox-exec: <sandbox-exec> -f <profile.sb> <cmd...>
    /// none:         <cmd...>
    ///
    /// Fails only when a seatbelt profile cannot be written.
    [[nodiscard]] auto build(std::string_view command, const Boundaries& boundaries) const
        -> Result<std::vector<std::string>>;

    [[nodiscard]] auto binary() const noexcept -> const ResolvedBinary& { return binary_; }

    /// Renders a seatbelt (SBPL) profile granting exactly `boundaries`.
    static auto render_seatbelt_profile(const Boundaries& boundaries) -> std::string;

    /// Where the profile with the given contents is stored (content-addressed).
    [[nodiscard]] auto seatbelt_profile_path(std::string_view profile) const
        -> std::filesystem::path;

    /// Resolves a bind path through its nearest existing ancestor, so a
    /// symlinked parent with a not-yet-existing leaf still canonicalises.
    static auto canonicalize_boundary_path(const std::filesystem::path& path)
        -> Result<std::filesystem::path>;

private:
    [[nodiscard]] auto build_bwrap(std::vector<std::string> command,
                                   const Boundaries& boundaries) const -> std::vector<std::string>;
    [[nodiscard]] auto build_sandbox_exec(std::vector<std::string> command,
                                          const Boundaries& boundaries) const
        -> Result<std::vector<std::string>>;
    [[nodiscard]] auto write_profile(std::string_view profile) const
        -> Result<std::filesystem::path>;

    ResolvedBinary binary_;
    std::filesystem::path profile_dir_;
};

} // namespace cmdguard::sandbox
