#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <sstream>
#include <iomanip>
#include <random>
#include <mutex>

namespace utils {

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Megabytes with one decimal ("212.4 MB"); signed adds a leading '+' when positive
inline std::string format_mb(double mb, bool signed_delta = false) {
    std::ostringstream ss;
    if (signed_delta) ss << std::showpos;
    ss << std::fixed << std::setprecision(1) << mb << " MB";
    return ss.str();
}

// Format duration as "1h 23m 45s", "2m 5s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m " +
           std::to_string(seconds % 60) + "s";
}

// Whole seconds left until deadline, rounded up; 0 once it has passed
template<typename TimePoint>
inline u64 seconds_until(TimePoint deadline, TimePoint now) {
    if (now >= deadline) return 0;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    return (u64)((ms + 999) / 1000);
}

// Strict unsigned parse: whole string must be digits. Returns false on
// empty input, junk or overflow.
inline bool parse_u64(const std::string& s, u64& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
    out = (u64)v;
    return true;
}

inline bool parse_i64(const std::string& s, i64& out) {
    if (s.empty()) return false;
    bool neg = s[0] == '-';
    u64 mag = 0;
    if (!parse_u64(neg ? s.substr(1) : s, mag)) return false;
    if (mag > (u64)INT64_MAX) return false;
    out = neg ? -(i64)mag : (i64)mag;
    return true;
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Random 64-bit identifier, never 0 (0 is reserved for "unset")
inline u64 random_id() {
    static std::mutex mtx;
    static std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<u64> dist;
    std::lock_guard<std::mutex> lk(mtx);
    u64 v = dist(gen);
    return v == 0 ? 1 : v;
}

// Progress percentage string
inline std::string format_percent(u64 done, u64 total) {
    if (total == 0) return "100%";
    double pct = (double)done / (double)total * 100.0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << pct << "%";
    return ss.str();
}

// Lowercase hex of a byte range
inline std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace utils
