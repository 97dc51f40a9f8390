#pragma once

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace Tmber {
namespace Utils {

/**
 * @brief Splits a string on a single delimiter, keeping empty fields.
 *
 * "a\t\tb" split on '\t' yields {"a", "", "b"}.
 */
inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            fields.push_back(s.substr(start));
            break;
        }
        fields.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

/**
 * @brief Parses a whole string as a base-10 integer.
 *
 * Only an optional '-' followed by digits is accepted; leading whitespace
 * and '+' are rejected.
 *
 * @return nullopt on empty input, trailing garbage or overflow.
 */
inline std::optional<int64_t> parse_int64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    if (s[0] != '-' && !std::isdigit(static_cast<unsigned char>(s[0]))) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    return static_cast<int64_t>(v);
}

/**
 * @brief Parses a whole string as a finite floating point number.
 * @return nullopt on empty input, trailing garbage, "nan" or "inf".
 */
inline std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace Utils
} // namespace Tmber
