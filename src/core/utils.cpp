#include "cmdguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace cmdguard::utils {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto timestamp_iso() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_val{};
    gmtime_r(&time, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%FT%TZ");
    return oss.str();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r\v\f");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\v\f");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto sha256(std::string_view data) -> std::string {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(hash[i]);
    }
    return oss.str();
}

auto is_blank(std::string_view s) -> bool {
    return std::ranges::all_of(s, is_space);
}

auto split_shell_words(std::string_view command) -> std::vector<std::string> {
    enum class Quote { None, Single, Double };

    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    Quote quote = Quote::None;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];

        switch (quote) {
            case Quote::Single:
                if (c == '\'') {
                    quote = Quote::None;
                } else {
                    current += c;
                }
                break;

            case Quote::Double:
                if (c == '"') {
                    quote = Quote::None;
                } else if (c == '\\' && i + 1 < command.size() &&
                           (command[i + 1] == '"' || command[i + 1] == '\\' ||
                            command[i + 1] == '$' || command[i + 1] == '`')) {
                    current += command[++i];
                } else {
                    current += c;
                }
                break;

            case Quote::None:
                if (is_space(c)) {
                    if (in_word) {
                        words.push_back(std::move(current));
                        current.clear();
                        in_word = false;
                    }
                } else if (c == '\'') {
                    quote = Quote::Single;
                    in_word = true;
                } else if (c == '"') {
                    quote = Quote::Double;
                    in_word = true;
                } else if (c == '\\' && i + 1 < command.size()) {
                    current += command[++i];
                    in_word = true;
                } else {
                    current += c;
                    in_word = true;
                }
                break;
        }
    }

    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

} // namespace cmdguard::utils
