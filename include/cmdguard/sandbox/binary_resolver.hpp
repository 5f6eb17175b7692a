#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "cmdguard/sandbox/types.hpp"

namespace cmdguard::sandbox {

/// Looks up an executable by name; returns its absolute path if found.
using ExecutableLookup =
    std::function<std::optional<std::filesystem::path>(std::string_view name)>;

/// Searches PATH for an executable regular file, like `which`.
auto find_executable_on_path(std::string_view name) -> std::optional<std::filesystem::path>;

/// The operating system this binary was compiled for.
auto detect_host_os() -> HostOs;

/// Detects which sandbox wrapper, if any, is available on a host.
class SandboxBinaryResolver {
public:
    virtual ~SandboxBinaryResolver() = default;

    [[nodiscard]] virtual auto resolve() const -> ResolvedBinary = 0;
};

/// Linux: bubblewrap (`bwrap`) on PATH.
class LinuxBinaryResolver final : public SandboxBinaryResolver {
public:
    explicit LinuxBinaryResolver(ExecutableLookup lookup = find_executable_on_path)
        : lookup_(std::move(lookup)) {}

    [[nodiscard]] auto resolve() const -> ResolvedBinary override;

private:
    ExecutableLookup lookup_;
};

/// macOS: `sandbox-exec` on PATH.
class DarwinBinaryResolver final : public SandboxBinaryResolver {
public:
    explicit DarwinBinaryResolver(ExecutableLookup lookup = find_executable_on_path)
        : lookup_(std::move(lookup)) {}

    [[nodiscard]] auto resolve() const -> ResolvedBinary override;

private:
    ExecutableLookup lookup_;
};

/// Windows and unrecognised systems: never sandboxed, no lookup performed.
class NullBinaryResolver final : public SandboxBinaryResolver {
public:
    [[nodiscard]] auto resolve() const -> ResolvedBinary override { return {}; }
};

auto make_binary_resolver(HostOs os, ExecutableLookup lookup = find_executable_on_path)
    -> std::unique_ptr<SandboxBinaryResolver>;

/// Pure mapping of (host OS, executable search) to a sandbox binary.
auto resolve_sandbox_binary(HostOs os, const ExecutableLookup& lookup) -> ResolvedBinary;

} // namespace cmdguard::sandbox
