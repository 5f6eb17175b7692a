#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard::sandbox {

/// Longest command, in bytes, the pattern checks will look at. Anything
/// longer is rejected before the first check runs.
inline constexpr std::size_t kMaxCommandLength = 4096;

/// Heuristic that fired on a command.
enum class InjectionCategory {
    CommandTooLong,
    ForkBomb,
    NullByte,
    UnicodeLookalike,
    SymlinkChain,
    DestructiveCommand,
    ShellMetacharacter,
    PathTraversal,
    BlockedPath,
};

auto injection_category_to_string(InjectionCategory category) -> std::string_view;

struct InjectionFinding {
    InjectionCategory category;
    std::string token;   // literal token or signature name that matched
    std::string reason;  // human-readable, names category and token
};

/// Token lists the detector scans for. The detector always scans the
/// built-in tokens; profile entries are appended after them.
struct DetectorPatterns {
    std::vector<std::string> shell_injection = default_shell_injection_patterns();
    std::vector<std::string> path_traversal = default_path_traversal_patterns();
    std::vector<std::string> blocked_paths;

    /// `;`, `&&`, `||`, `|`, backtick, `$(`, `>>`, `>`, `<`; longer tokens
    /// precede their prefixes so the reason names the most specific one.
    static auto default_shell_injection_patterns() -> std::vector<std::string>;
    static auto default_path_traversal_patterns() -> std::vector<std::string>;
};

/// Recognises adversarial command construction independently of the
/// policy's `blocked_patterns`.
///
/// Checks run in a fixed order and the first hit wins: oversized command,
/// fork bomb, null byte, unicode look-alike, symlink chain, destructive
/// signature, shell metacharacter, path traversal, blocked path.
class InjectionDetector {
public:
    /// Merges `patterns` onto the built-in token lists, so a profile can add
    /// metacharacters or traversal tokens but never remove one.
    explicit InjectionDetector(DetectorPatterns patterns = {});

    [[nodiscard]] auto scan(std::string_view command) const -> std::optional<InjectionFinding>;

    [[nodiscard]] auto patterns() const noexcept -> const DetectorPatterns& { return patterns_; }

    // Individual heuristics, exposed for testing and reuse.

    /// `name() { ... name | name ... }`, or `:` defined as a function and
    /// terminated with `;`. Linear in the input length.
    static auto detect_fork_bomb(std::string_view command) -> bool;
    static auto detect_symlink_chain(std::string_view command) -> bool;

    /// Returns the signature name ("rm -rf", "sudo", ...) that matched.
    static auto detect_destructive(std::string_view command) -> std::optional<std::string>;

    /// Returns "U+XXXX" for the first look-alike code point, or
    /// "malformed UTF-8" for an invalid byte sequence.
    static auto detect_unicode_lookalike(std::string_view command) -> std::optional<std::string>;

    /// Translates a `*` glob into an ECMAScript regex matching anywhere.
    static auto glob_to_regex(std::string_view glob) -> std::string;

private:
    struct BlockedPath {
        std::string source;
        std::optional<std::regex> glob;
    };

    DetectorPatterns patterns_;
    std::vector<BlockedPath> blocked_paths_;
};

} // namespace cmdguard::sandbox
