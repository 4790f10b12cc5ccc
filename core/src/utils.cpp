#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip>    // For std::get_time
#include <sstream>    // For std::istringstream
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>
#include <cstdlib>    // For std::strtod
#include <ctime>
#include <algorithm>

namespace core {
namespace utils {

    namespace {

        bool isAllDigits(const std::string& s, std::size_t from) {
            if (from >= s.size()) return false;
            return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(from), s.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        Timestamp fromEpochNumber(const std::string& text) {
            long long value = 0;
            try {
                value = std::stoll(text);
            } catch (const std::exception& e) {
                throw std::runtime_error("Failed to parse epoch timestamp '" + text + "': " + e.what());
            }
            // Values beyond ~5000 AD in seconds are taken as milliseconds (pandas exports ms)
            if (value > 99999999999LL || value < -99999999999LL) {
                return Timestamp(std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::milliseconds(value)));
            }
            return Timestamp(std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(value)));
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& raw) {
        std::string text = trim(raw);
        if (text.empty()) {
            throw std::runtime_error("Failed to parse timestamp: empty value");
        }

        // Epoch seconds or milliseconds
        if (isAllDigits(text, (text[0] == '-') ? 1 : 0)) {
            return fromEpochNumber(text);
        }

        // Accept "YYYY-MM-DD HH:MM:SS" (pandas default) and plain dates
        if (text.size() > 10 && text[10] == ' ') {
            text[10] = 'T';
        } else if (text.size() == 10) {
            text += "T00:00:00";
        }

        std::tm tm = {};
        std::istringstream ss(text);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + raw);
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            int digit_count = 0;
            while (std::isdigit(ss.peek()) && digit_count < 9) { // Limit precision (nanoseconds)
                digits += static_cast<char>(ss.get());
                digit_count++;
            }
            // Consume any remaining digits after precision limit
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Optional timezone offset (+HH:MM, -HH:MM, +HHMM or Z). No indicator means UTC.
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z' || sign_or_z == 'z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                std::string rest;
                ss >> rest;
                rest.erase(std::remove(rest.begin(), rest.end(), ':'), rest.end());
                if (rest.size() != 4 || !isAllDigits(rest, 0)) {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + raw);
                }
                int offset_h = std::stoi(rest.substr(0, 2));
                int offset_m = std::stoi(rest.substr(2, 2));
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + raw);
            }
            std::string trailing;
            if (ss >> trailing) {
                throw std::runtime_error("Unexpected trailing characters in timestamp: " + raw);
            }
        }

        // 4. Convert tm to time_t (UTC seconds since epoch)
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1 && !(tm.tm_year == 69 && tm.tm_mon == 11 && tm.tm_mday == 31)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + raw);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // Local time minus its offset gives UTC
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        long long total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
        long long secs = total_ms / 1000;
        long long ms = total_ms % 1000;
        if (ms < 0) { // Adjust for negative remainders
            ms += 1000;
            secs -= 1;
        }
        time_t tt = static_cast<time_t>(secs);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");
        if (ms != 0) {
            oss << '.' << std::setfill('0') << std::setw(3) << ms;
        }
        oss << 'Z';
        return oss.str();
    }

    std::optional<std::chrono::seconds> timeframeDuration(const std::string& timeframe) {
        if (timeframe.size() < 2) return std::nullopt;
        const char unit = timeframe.back();
        const std::string count_str = timeframe.substr(0, timeframe.size() - 1);
        if (!isAllDigits(count_str, 0)) return std::nullopt;

        long long count = 0;
        try {
            count = std::stoll(count_str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (count <= 0) return std::nullopt;

        switch (unit) {
            case 'm': return std::chrono::seconds(count * 60);
            case 'h': case 'H': return std::chrono::seconds(count * 3600);
            case 'd': case 'D': return std::chrono::seconds(count * 86400);
            case 'w': case 'W': return std::chrono::seconds(count * 7 * 86400);
            default: return std::nullopt;
        }
    }

    bool isKnownTimeframe(const std::string& timeframe) {
        return timeframeDuration(timeframe).has_value();
    }

    std::string formatNumber(double value) {
        return fmt::format("{}", value);
    }

    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::optional<double> parseDouble(const std::string& raw) {
        const std::string text = trim(raw);
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') {
            return std::nullopt;
        }
        return value;
    }

} // namespace utils
} // namespace core
