#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <optional>

namespace core {
namespace utils {

    // Format as ISO 8601 UTC, e.g. 2024-01-01T10:00:00Z (milliseconds only when non-zero)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 ("2024-01-01T10:00:00Z", "2024-01-01 10:00:00", "+05:30" offsets,
    // date only) or integer epoch seconds / milliseconds. Strings without a zone are UTC.
    Timestamp stringToTimestamp(const std::string& text);

    // Duration of a timeframe label ("1m", "15m", "1H", "4H", "1D", ...)
    std::optional<std::chrono::seconds> timeframeDuration(const std::string& timeframe);
    bool isKnownTimeframe(const std::string& timeframe);

    // Shortest representation that round-trips, used for every number written to output files
    std::string formatNumber(double value);

    std::string trim(const std::string& s);
    std::string toUpper(std::string s);
    std::string toLower(std::string s);

    // Strict double parse: whole string must be consumed. "nan"/"inf" parse to non-finite values.
    std::optional<double> parseDouble(const std::string& text);

} // namespace utils
} // namespace core
