#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard::utils {

auto timestamp_ms() -> int64_t;
auto timestamp_iso() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto sha256(std::string_view data) -> std::string;

/// True when `s` is empty or holds only ASCII whitespace.
auto is_blank(std::string_view s) -> bool;

/// Splits a command line into words following POSIX shell quoting:
/// single quotes are literal, double quotes honour backslash escapes of
/// `"`, `\`, `$` and backtick, and a bare backslash escapes the next
/// character. An unterminated quote runs to the end of the input.
auto split_shell_words(std::string_view command) -> std::vector<std::string>;

} // namespace cmdguard::utils
