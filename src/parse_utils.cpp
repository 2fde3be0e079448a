#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Unsigned decimal without sign or whitespace.
bool to_ull(const std::string& s, unsigned long long& out) {
    if (!all_digits(s))
        return false;
    errno = 0;
    out = std::strtoull(s.c_str(), nullptr, 10);
    return errno != ERANGE;
}

// Split "15m" into 15 and "m".
bool split_unit(const std::string& value, unsigned long long& n, std::string& unit) {
    size_t pos = 0;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])))
        ++pos;
    unit = value.substr(pos);
    return to_ull(value.substr(0, pos), n);
}

} // namespace

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    std::string digits = value;
    if (!digits.empty() && (digits[0] == '+' || digits[0] == '-'))
        digits.erase(0, 1);
    if (!all_digits(digits))
        return 0;
    errno = 0;
    long long v = std::strtoll(value.c_str(), nullptr, 10);
    if (errno == ERANGE || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<int>(v);
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lower(value);
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    unsigned long long base = 0;
    std::string unit;
    if (!split_unit(lower(value), base, unit))
        return 0;
    unsigned long long mult = 1;
    if (unit.empty() || unit == "b")
        mult = 1;
    else if (unit == "k" || unit == "kb")
        mult = 1024ull;
    else if (unit == "m" || unit == "mb")
        mult = 1024ull * 1024;
    else if (unit == "g" || unit == "gb")
        mult = 1024ull * 1024 * 1024;
    else if (unit == "t" || unit == "tb")
        mult = 1024ull * 1024 * 1024 * 1024;
    else
        return 0;
    if (base > ULLONG_MAX / mult)
        return 0;
    ok = true;
    return static_cast<size_t>(base * mult);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    unsigned long long n = 0;
    std::string unit;
    if (!split_unit(value, n, unit) || n > static_cast<unsigned long long>(INT_MAX))
        return std::chrono::seconds(0);
    long long v = static_cast<long long>(n);
    std::chrono::seconds out(0);
    if (unit.empty() || unit == "s")
        out = std::chrono::seconds(v);
    else if (unit == "m")
        out = std::chrono::minutes(v);
    else if (unit == "h")
        out = std::chrono::hours(v);
    else if (unit == "d")
        out = std::chrono::hours(24 * v);
    else if (unit == "w")
        out = std::chrono::hours(24 * 7 * v);
    else
        return std::chrono::seconds(0);
    ok = true;
    return out;
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    unsigned long long n = 0;
    std::string unit;
    if (!split_unit(value, n, unit) || n > static_cast<unsigned long long>(INT_MAX))
        return std::chrono::milliseconds(0);
    long long v = static_cast<long long>(n);
    std::chrono::milliseconds out(0);
    if (unit.empty() || unit == "ms")
        out = std::chrono::milliseconds(v);
    else if (unit == "s")
        out = std::chrono::seconds(v);
    else if (unit == "m")
        out = std::chrono::minutes(v);
    else
        return std::chrono::milliseconds(0);
    ok = true;
    return out;
}
