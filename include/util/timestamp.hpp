#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace gdfs::util {

// Drive timestamps are RFC 3339 in UTC, e.g. "2018-09-29T08:39:12.053Z". Sub-second precision is dropped.
inline std::time_t parseRfc3339(const std::string& ts) {
    if (ts.empty()) return 0;
    std::tm tm = {};
    std::istringstream ss(ts.substr(0, 19)); // "YYYY-MM-DDTHH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + ts);
    return timegm(&tm);
}

inline std::string formatRfc3339(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << ".000Z";
    return oss.str();
}

inline std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace gdfs::util
