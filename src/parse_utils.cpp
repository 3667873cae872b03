#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <sstream>
#include <stdexcept>

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long v = std::stoul(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<unsigned int>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

unsigned int parse_uint(const ArgParser& parser, const std::string& flag, unsigned int min,
                        unsigned int max, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_uint(parser.get_option(flag), min, max, ok);
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    unsigned long long mult = 1;
    auto strip = [&](const std::string& suf, unsigned long long m) {
        if (val.size() > suf.size() &&
            val.compare(val.size() - suf.size(), suf.size(), suf) == 0) {
            val.erase(val.size() - suf.size());
            mult = m;
            return true;
        }
        return false;
    };
    if (!strip("kb", 1024ull) && !strip("mb", 1024ull * 1024) &&
        !strip("gb", 1024ull * 1024 * 1024))
        strip("b", 1);
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    ok = true;
    return static_cast<size_t>(base * mult);
}

size_t parse_bytes(const ArgParser& parser, const std::string& flag, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_bytes(parser.get_option(flag), ok);
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string num = value;
    long long mult = 1;
    if (num.size() > 2 && num.compare(num.size() - 2, 2, "ms") == 0) {
        num.erase(num.size() - 2);
    } else if (!num.empty() && num.back() == 's') {
        num.pop_back();
        mult = 1000;
    } else if (!num.empty() && num.back() == 'm') {
        num.pop_back();
        mult = 60 * 1000;
    }
    if (!all_digits(num))
        return std::chrono::milliseconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (const std::exception&) {
        return std::chrono::milliseconds(0);
    }
    if (n > LLONG_MAX / mult)
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(n * mult);
}

std::vector<std::string> split_command(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream iss(value);
    std::string word;
    while (iss >> word)
        out.push_back(word);
    return out;
}
