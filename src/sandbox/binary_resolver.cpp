#include "cmdguard/sandbox/binary_resolver.hpp"

#include "cmdguard/core/logger.hpp"
#include "cmdguard/core/utils.hpp"

#include <cstdlib>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace cmdguard::sandbox {

namespace fs = std::filesystem;

namespace {

auto is_executable_file(const fs::path& candidate) -> bool {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec) || ec) {
        return false;
    }
#ifndef _WIN32
    return ::access(candidate.c_str(), X_OK) == 0;
#else
    return true;
#endif
}

auto resolve_with(const ExecutableLookup& lookup, std::string_view name, SandboxBinary kind)
    -> ResolvedBinary {
    std::optional<fs::path> found;
    if (lookup) {
        found = lookup(name);
    }
    if (!found.has_value()) {
        LOG_DEBUG("Sandbox: '{}' not found on PATH", name);
        return {};
    }
    LOG_DEBUG("Sandbox: using {} at {}", name, found->string());
    return {kind, *found};
}

} // namespace

auto find_executable_on_path(std::string_view name) -> std::optional<fs::path> {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string_view::npos) {
        fs::path direct(name);
        if (is_executable_file(direct)) {
            std::error_code ec;
            auto abs = fs::absolute(direct, ec);
            return ec ? direct : abs;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) return std::nullopt;

#ifdef _WIN32
    constexpr char kSeparator = ';';
#else
    constexpr char kSeparator = ':';
#endif

    for (const auto& dir : utils::split(path_env, kSeparator)) {
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / std::string(name);
        if (is_executable_file(candidate)) {
            std::error_code ec;
            auto abs = fs::absolute(candidate, ec);
            return ec ? candidate : abs;
        }
    }
    return std::nullopt;
}

auto detect_host_os() -> HostOs {
#if defined(__linux__)
    return HostOs::Linux;
#elif defined(__APPLE__)
    return HostOs::Darwin;
#elif defined(_WIN32)
    return HostOs::Windows;
#else
    return HostOs::Other;
#endif
}

auto LinuxBinaryResolver::resolve() const -> ResolvedBinary {
    return resolve_with(lookup_, "bwrap", SandboxBinary::Bwrap);
}

auto DarwinBinaryResolver::resolve() const -> ResolvedBinary {
    return resolve_with(lookup_, "sandbox-exec", SandboxBinary::SandboxExec);
}

auto make_binary_resolver(HostOs os, ExecutableLookup lookup)
    -> std::unique_ptr<SandboxBinaryResolver> {
    switch (os) {
        case HostOs::Linux:
            return std::make_unique<LinuxBinaryResolver>(std::move(lookup));
        case HostOs::Darwin:
            return std::make_unique<DarwinBinaryResolver>(std::move(lookup));
        case HostOs::Windows:
        case HostOs::Other:
        default:
            return std::make_unique<NullBinaryResolver>();
    }
}

auto resolve_sandbox_binary(HostOs os, const ExecutableLookup& lookup) -> ResolvedBinary {
    return make_binary_resolver(os, lookup)->resolve();
}

} // namespace cmdguard::sandbox
