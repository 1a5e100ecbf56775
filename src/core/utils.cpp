#include <tabwright/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <limits>

namespace tabwright {

// ============ Time utilities ============

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

std::string format_duration_ms(int64_t ms) {
    char buf[32];
    if (ms < 1000) {
        snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(ms));
    } else if (ms < 60000) {
        if (ms % 1000 == 0) {
            snprintf(buf, sizeof(buf), "%llds", static_cast<long long>(ms / 1000));
        } else {
            snprintf(buf, sizeof(buf), "%.1fs", ms / 1000.0);
        }
    } else {
        long long secs = ms / 1000;
        snprintf(buf, sizeof(buf), "%lldm%02llds", secs / 60, secs % 60);
    }
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(0, end);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_trailing(const std::string& s, char c) {
    size_t end = s.size();
    while (end > 0 && s[end - 1] == c) {
        --end;
    }
    return s.substr(0, end);
}

std::string url_encode_query(const std::string& s) {
    std::string result;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else if (c == ' ') {
            result += '+';
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", (unsigned char)c);
            result += buf;
        }
    }
    return result;
}

bool parse_int64(const std::string& s, int64_t& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    int64_t value = 0;
    for (size_t i = 0; i < t.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(t[i]))) return false;
        int digit = t[i] - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace tabwright
