/**
 * Seedhound Console Formatting
 *
 * Human-readable counts, rates and durations for progress lines.
 */

#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace seedhound {

/**
 * Format a count with a K/M/G suffix and 1 decimal place. Counts below 1000
 * are printed whole.
 */
inline std::string format_count(uint64_t n) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (n >= 1000000000ULL) {
        oss << (static_cast<double>(n) / 1e9) << "G";
    } else if (n >= 1000000ULL) {
        oss << (static_cast<double>(n) / 1e6) << "M";
    } else if (n >= 1000ULL) {
        oss << (static_cast<double>(n) / 1e3) << "K";
    } else {
        oss << n;
    }
    return oss.str();
}

/** Candidates per second, with one decimal place below 1000. */
inline std::string format_rate(double rate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (rate >= 1e9) oss << rate / 1e9 << "G";
    else if (rate >= 1e6) oss << rate / 1e6 << "M";
    else if (rate >= 1e3) oss << rate / 1e3 << "K";
    else oss << rate;
    oss << "/s";
    return oss.str();
}

inline std::string format_duration(double seconds) {
    if (seconds < 0) return "unknown";
    if (seconds > 86400.0 * 365 * 100) return "centuries";
    uint64_t s = static_cast<uint64_t>(seconds);
    std::ostringstream ss;
    if (s >= 86400) ss << s / 86400 << "d ";
    ss << std::setfill('0') << std::setw(2) << (s % 86400) / 3600 << ":"
       << std::setw(2) << (s % 3600) / 60 << ":" << std::setw(2) << s % 60;
    return ss.str();
}

}  // namespace seedhound
