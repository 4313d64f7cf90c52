#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tripsift::common {

/**
 * Copy of the input with leading and trailing ASCII whitespace removed.
 */
[[nodiscard]] inline std::string trimCopy(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return std::string(s.substr(begin, end - begin));
}

[[nodiscard]] inline std::string toLowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * Title-cases every whitespace or hyphen separated word ("new york" -> "New York").
 * Bytes outside ASCII are copied through untouched.
 */
[[nodiscard]] inline std::string toTitleCase(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool startOfWord = true;
    for (unsigned char c : s) {
        if (std::isspace(c) || c == '-') {
            out.push_back(static_cast<char>(c));
            startOfWord = true;
            continue;
        }
        out.push_back(static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c)));
        startOfWord = false;
    }
    return out;
}

/**
 * Case-insensitive comparison after trimming both sides.
 */
[[nodiscard]] inline bool equalsNormalized(std::string_view a, std::string_view b) {
    return toLowerCopy(trimCopy(a)) == toLowerCopy(trimCopy(b));
}

/**
 * Splits a comma separated list, trimming and lower-casing each entry and dropping empties.
 */
[[nodiscard]] inline std::vector<std::string> splitList(std::string_view raw) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t comma = raw.find(',', pos);
        if (comma == std::string_view::npos)
            comma = raw.size();
        auto item = toLowerCopy(trimCopy(raw.substr(pos, comma - pos)));
        if (!item.empty())
            out.push_back(std::move(item));
        pos = comma + 1;
    }
    return out;
}

/**
 * Parses the whole (trimmed) string as a finite decimal number.
 * Returns nullopt on trailing garbage, empty input or overflow.
 */
[[nodiscard]] inline std::optional<double> parseNumber(std::string_view raw) {
    auto text = trimCopy(raw);
    if (text.empty())
        return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size())
        return std::nullopt;
    if (!std::isfinite(value))
        return std::nullopt;
    return value;
}

/**
 * Accepts true/false, yes/no, 1/0 in any case.
 */
[[nodiscard]] inline std::optional<bool> parseBool(std::string_view raw) {
    auto text = toLowerCopy(trimCopy(raw));
    if (text == "true" || text == "yes" || text == "1")
        return true;
    if (text == "false" || text == "no" || text == "0")
        return false;
    return std::nullopt;
}

} // namespace tripsift::common
