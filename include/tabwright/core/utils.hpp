#ifndef TABWRIGHT_CORE_UTILS_HPP
#define TABWRIGHT_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace tabwright {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Milliseconds elapsed since `since` on the steady clock
int64_t elapsed_ms(std::chrono::steady_clock::time_point since);

// Format a millisecond duration for log messages ("750ms", "20s", "2m05s")
std::string format_duration_ms(int64_t ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

std::string ltrim(const std::string& s);

std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

std::string to_upper(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Remove every trailing occurrence of `c`
std::string strip_trailing(const std::string& s, char c);

// Percent-encode for a query string (spaces become '+')
std::string url_encode_query(const std::string& s);

// Parse a non-negative integer; false on junk or overflow
bool parse_int64(const std::string& s, int64_t& out);

} // namespace tabwright

#endif // TABWRIGHT_CORE_UTILS_HPP
