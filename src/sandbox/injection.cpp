#include "cmdguard/sandbox/injection.hpp"

#include "cmdguard/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace cmdguard::sandbox {

namespace {

struct CodePointRange {
    char32_t first;
    char32_t last;
};

// Code points that render like shell metacharacters, dots or whitespace.
constexpr std::array<CodePointRange, 23> kLookalikes = {{
    {0x00A0, 0x00A0},  // no-break space
    {0x01C0, 0x01C0},  // dental click, looks like |
    {0x037E, 0x037E},  // greek question mark, looks like ;
    {0x1680, 0x1680},  // ogham space mark
    {0x2000, 0x200B},  // en quad .. zero width space
    {0x2024, 0x2024},  // one dot leader
    {0x2028, 0x2029},  // line / paragraph separator
    {0x202F, 0x202F},  // narrow no-break space
    {0x2035, 0x2035},  // reversed prime, looks like `
    {0x205F, 0x205F},  // medium mathematical space
    {0x2223, 0x2223},  // divides, looks like |
    {0x3000, 0x3000},  // ideographic space
    {0xFE54, 0xFE54},  // small semicolon
    {0xFE60, 0xFE60},  // small ampersand
    {0xFEFF, 0xFEFF},  // zero width no-break space
    {0xFF04, 0xFF04},  // fullwidth $
    {0xFF06, 0xFF06},  // fullwidth &
    {0xFF0E, 0xFF0E},  // fullwidth .
    {0xFF1B, 0xFF1C},  // fullwidth ; <
    {0xFF1E, 0xFF1E},  // fullwidth >
    {0xFF40, 0xFF40},  // fullwidth `
    {0xFF5C, 0xFF5C},  // fullwidth |
    {0xFFE8, 0xFFE8},  // halfwidth light vertical
}};

auto is_lookalike(char32_t cp) -> bool {
    return std::ranges::any_of(kLookalikes,
        [cp](const CodePointRange& r) { return cp >= r.first && cp <= r.last; });
}

/// Decodes one UTF-8 sequence starting at `i`, advancing it. Returns
/// nullopt for malformed or overlong input.
auto decode_utf8(std::string_view s, size_t& i) -> std::optional<char32_t> {
    auto lead = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    char32_t cp = 0;

    if (lead < 0x80) {
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return std::nullopt;
    }

    if (i + len > s.size()) return std::nullopt;
    for (size_t k = 1; k < len; ++k) {
        auto c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (c & 0x3F);
    }

    static constexpr std::array<char32_t, 5> kMinForLength = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return std::nullopt;
    }

    i += len;
    return cp;
}

auto describe_metacharacter(std::string_view token) -> std::string_view {
    if (token == ";" || token == "&&" || token == "||") return "command chaining";
    if (token == "|") return "pipe";
    if (token == "`" || token == "$(") return "command substitution";
    if (token == ">" || token == ">>" || token == "<") return "redirection";
    return "shell metacharacter";
}

auto is_chain_token(std::string_view word) -> bool {
    return word == ";" || word == "&&" || word == "||" || word == "|" || word == "&";
}

/// Recursive force delete in any flag spelling: -rf, -fr, -r -f, -Rf,
/// --recursive --force, with flags before or after operands.
auto has_recursive_force_rm(std::string_view command) -> bool {
    auto words = utils::split_shell_words(command);
    for (size_t i = 0; i < words.size(); ++i) {
        if (std::filesystem::path(words[i]).filename().string() != "rm") continue;

        bool recursive = false;
        bool force = false;
        for (size_t j = i + 1; j < words.size() && !is_chain_token(words[j]); ++j) {
            const auto& w = words[j];
            if (w == "--") break;
            if (w == "--recursive") {
                recursive = true;
            } else if (w == "--force") {
                force = true;
            } else if (w.size() > 1 && w[0] == '-' && w[1] != '-') {
                if (w.find_first_of("rR") != std::string::npos) recursive = true;
                if (w.find('f') != std::string::npos) force = true;
            }
        }
        if (recursive && force) return true;
    }
    return false;
}

auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto skip_spaces(std::string_view s, size_t i) -> size_t {
    while (i < s.size() && is_space(s[i])) ++i;
    return i;
}

/// Position just past `name` when it occurs at `i` as a whole word.
auto match_word(std::string_view s, size_t i, std::string_view name) -> std::optional<size_t> {
    if (i > s.size() || s.substr(i).substr(0, name.size()) != name) return std::nullopt;
    size_t end = i + name.size();
    if (name != ":") {
        if (i > 0 && is_word_char(s[i - 1])) return std::nullopt;
        if (end < s.size() && is_word_char(s[end])) return std::nullopt;
    }
    return end;
}

/// True when `body` pipes `name` into itself (`name | name`).
auto pipes_to_itself(std::string_view body, std::string_view name) -> bool {
    for (size_t pos = body.find(name); pos != std::string_view::npos; pos = body.find(name, pos + 1)) {
        auto end = match_word(body, pos, name);
        if (!end) continue;
        size_t i = skip_spaces(body, *end);
        if (i >= body.size() || body[i] != '|') continue;
        if (match_word(body, skip_spaces(body, i + 1), name)) return true;
    }
    return false;
}

/// Name of the function whose `(` sits at `paren`: `:` or an identifier.
auto function_name_before(std::string_view s, size_t paren) -> std::string_view {
    size_t end = paren;
    while (end > 0 && is_space(s[end - 1])) --end;
    if (end == 0) return {};
    if (s[end - 1] == ':') return s.substr(end - 1, 1);

    size_t start = end;
    while (start > 0 && is_word_char(s[start - 1])) --start;
    if (start == end || std::isdigit(static_cast<unsigned char>(s[start])) != 0) return {};
    return s.substr(start, end - start);
}

auto with_defaults(std::vector<std::string> defaults, const std::vector<std::string>& extra)
    -> std::vector<std::string> {
    for (const auto& token : extra) {
        if (token.empty() || std::ranges::find(defaults, token) != defaults.end()) continue;
        defaults.push_back(token);
    }
    return defaults;
}

struct Signature {
    const char* name;
    std::regex pattern;
};

auto destructive_signatures() -> const std::vector<Signature>& {
    static const std::vector<Signature> signatures = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        constexpr const char* raw_device = R"(/dev/(sd|hd|vd|xvd|nvme|mmcblk|disk|rdisk))";
        std::vector<Signature> s;
        s.push_back({"sudo", std::regex(R"((^|[^\w-])sudo\b)", flags)});
        s.push_back({"chmod 777", std::regex(R"(\bchmod\s+(-\w+\s+)*0?777\b)", flags)});
        s.push_back({"dd if= (raw device)",
                     std::regex(std::string(R"(\bdd\b.*\b(if|of)=)") + raw_device, flags)});
        s.push_back({"write to raw block device",
                     std::regex(std::string(R"(>\s*)") + raw_device, flags)});
        s.push_back({"mkfs (disk wipe)", std::regex(R"(\bmkfs(\.\w+)?\b)", flags)});
        s.push_back({"git push --force",
                     std::regex(R"(\bgit\s+push\b.*(\s--force(-with-lease)?\b|\s-f\b))", flags)});
        return s;
    }();
    return signatures;
}

} // namespace

auto injection_category_to_string(InjectionCategory category) -> std::string_view {
    switch (category) {
        case InjectionCategory::CommandTooLong: return "command_too_long";
        case InjectionCategory::ForkBomb: return "fork_bomb";
        case InjectionCategory::NullByte: return "null_byte";
        case InjectionCategory::UnicodeLookalike: return "unicode_lookalike";
        case InjectionCategory::SymlinkChain: return "symlink_chain";
        case InjectionCategory::DestructiveCommand: return "destructive_command";
        case InjectionCategory::ShellMetacharacter: return "shell_metacharacter";
        case InjectionCategory::PathTraversal: return "path_traversal";
        case InjectionCategory::BlockedPath: return "blocked_path";
        default: return "unknown";
    }
}

auto DetectorPatterns::default_shell_injection_patterns() -> std::vector<std::string> {
    return {";", "&&", "||", "|", "`", "$(", ">>", ">", "<"};
}

auto DetectorPatterns::default_path_traversal_patterns() -> std::vector<std::string> {
    return {".."};
}

InjectionDetector::InjectionDetector(DetectorPatterns patterns)
    : patterns_(std::move(patterns))
{
    patterns_.shell_injection = with_defaults(DetectorPatterns::default_shell_injection_patterns(),
                                              patterns_.shell_injection);
    patterns_.path_traversal = with_defaults(DetectorPatterns::default_path_traversal_patterns(),
                                             patterns_.path_traversal);

    for (const auto& entry : patterns_.blocked_paths) {
        if (entry.empty()) continue;
        BlockedPath bp{entry, std::nullopt};
        if (entry.find('*') != std::string::npos) {
            bp.glob = std::regex(glob_to_regex(entry), std::regex::ECMAScript);
        }
        blocked_paths_.push_back(std::move(bp));
    }
}

auto InjectionDetector::detect_fork_bomb(std::string_view command) -> bool {
    for (size_t paren = command.find('('); paren != std::string_view::npos;
         paren = command.find('(', paren + 1)) {
        auto name = function_name_before(command, paren);
        if (name.empty()) continue;

        size_t i = skip_spaces(command, paren + 1);
        if (i >= command.size() || command[i] != ')') continue;
        i = skip_spaces(command, i + 1);
        if (i >= command.size() || command[i] != '{') continue;

        size_t close = command.find('}', i + 1);
        auto body = command.substr(i + 1, close == std::string_view::npos ? std::string_view::npos
                                                                           : close - i - 1);
        if (pipes_to_itself(body, name)) return true;

        if (name == ":" && close != std::string_view::npos) {
            size_t after = skip_spaces(command, close + 1);
            if (after < command.size() && command[after] == ';') return true;
        }
    }
    return false;
}

auto InjectionDetector::detect_symlink_chain(std::string_view command) -> bool {
    static const std::regex chain(R"(\bln\s+(-\w*s\w*|--symbolic)\b[^;&|]*(;|&&|\|\||\|)\s*\S)");
    return std::regex_search(command.begin(), command.end(), chain);
}

auto InjectionDetector::detect_destructive(std::string_view command) -> std::optional<std::string> {
    if (has_recursive_force_rm(command)) {
        return "rm -rf";
    }
    for (const auto& sig : destructive_signatures()) {
        if (std::regex_search(command.begin(), command.end(), sig.pattern)) {
            return std::string(sig.name);
        }
    }
    return std::nullopt;
}

auto InjectionDetector::detect_unicode_lookalike(std::string_view command)
    -> std::optional<std::string> {
    size_t i = 0;
    while (i < command.size()) {
        auto cp = decode_utf8(command, i);
        if (!cp.has_value()) {
            return std::string("malformed UTF-8");
        }
        if (*cp >= 0x80 && is_lookalike(*cp)) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(*cp));
            return std::string(buf);
        }
    }
    return std::nullopt;
}

auto InjectionDetector::glob_to_regex(std::string_view glob) -> std::string {
    static constexpr std::string_view kSpecial = R"(\^$.|?+()[]{})";
    std::string out;
    out.reserve(glob.size() * 2);
    for (char c : glob) {
        if (c == '*') {
            out += ".*";
        } else if (kSpecial.find(c) != std::string_view::npos) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

auto InjectionDetector::scan(std::string_view command) const -> std::optional<InjectionFinding> {
    if (command.size() > kMaxCommandLength) {
        return InjectionFinding{InjectionCategory::CommandTooLong, std::to_string(command.size()),
                                "Command too long (" + std::to_string(command.size()) +
                                " bytes, limit " + std::to_string(kMaxCommandLength) + ")"};
    }

    if (detect_fork_bomb(command)) {
        return InjectionFinding{InjectionCategory::ForkBomb, ":(){ :|:& };:",
                                "Fork bomb pattern detected"};
    }

    if (command.find('\0') != std::string_view::npos) {
        return InjectionFinding{InjectionCategory::NullByte, "\\0",
                                "Null byte detected in command"};
    }

    if (auto what = detect_unicode_lookalike(command)) {
        return InjectionFinding{InjectionCategory::UnicodeLookalike, *what,
                                "Unicode look-alike character detected (" + *what + ")"};
    }

    if (detect_symlink_chain(command)) {
        return InjectionFinding{InjectionCategory::SymlinkChain, "ln -s",
                                "Symlink chaining attack detected (ln -s followed by a chained command)"};
    }

    if (auto sig = detect_destructive(command)) {
        return InjectionFinding{InjectionCategory::DestructiveCommand, *sig,
                                "Destructive command detected: " + *sig};
    }

    for (const auto& token : patterns_.shell_injection) {
        if (!token.empty() && command.find(token) != std::string_view::npos) {
            return InjectionFinding{InjectionCategory::ShellMetacharacter, token,
                "Shell injection pattern detected: '" + token + "' (" +
                std::string(describe_metacharacter(token)) + ")"};
        }
    }

    for (const auto& token : patterns_.path_traversal) {
        if (!token.empty() && command.find(token) != std::string_view::npos) {
            return InjectionFinding{InjectionCategory::PathTraversal, token,
                                    "Path traversal pattern detected (" + token + ")"};
        }
    }

    for (const auto& bp : blocked_paths_) {
        bool hit = bp.glob.has_value()
            ? std::regex_search(command.begin(), command.end(), *bp.glob)
            : command.find(bp.source) != std::string_view::npos;
        if (hit) {
            return InjectionFinding{InjectionCategory::BlockedPath, bp.source,
                                    "Blocked path detected: " + bp.source};
        }
    }

    return std::nullopt;
}

} // namespace cmdguard::sandbox
