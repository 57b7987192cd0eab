#include "pickassoc/core/timestamp.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pickassoc {

namespace {

// Reads exactly `count` digits starting at pos, advancing pos
bool readDigits(const std::string& text, size_t& pos, size_t count, int& value) {
    if (pos + count > text.size()) return false;
    value = 0;
    for (size_t i = 0; i < count; i++) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

bool expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    pos++;
    return true;
}

} // namespace

std::optional<TimePoint> parseTimestamp(const std::string& text) {
    std::tm tm{};
    size_t pos = 0;
    int year, month, day, hour, minute, second;
    
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    
    hour = minute = second = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        pos++;
        if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, second)) {
            return std::nullopt;
        }
    }
    
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }
    
    // Fractional seconds, kept to microseconds
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        size_t ndigits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (ndigits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ndigits++;
            pos++;
        }
        if (ndigits == 0) return std::nullopt;
        for (size_t i = ndigits; i < 6; i++) micros *= 10;
    }
    
    // UTC offset
    int64_t offset_seconds = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z') {
            pos++;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = text[pos] == '-' ? -1 : 1;
            pos++;
            int oh, om = 0;
            if (!readDigits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') pos++;
            if (pos < text.size() && !readDigits(text, pos, 2, om)) return std::nullopt;
            offset_seconds = sign * (oh * 3600 + om * 60);
        }
    }
    if (pos != text.size()) return std::nullopt;
    
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    
    std::time_t t = timegm(&tm);
    
    TimePoint result = std::chrono::system_clock::from_time_t(t);
    result += std::chrono::microseconds(micros);
    result -= std::chrono::seconds(offset_seconds);
    return result;
}

std::string formatTimestamp(TimePoint time) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(
        time.time_since_epoch());
    auto ms = std::chrono::floor<std::chrono::milliseconds>(since_epoch);
    auto secs = std::chrono::floor<std::chrono::seconds>(ms);
    
    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);
    
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << (ms - secs).count();
    return oss.str();
}

double toSeconds(TimePoint time) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        time.time_since_epoch());
    return us.count() / 1e6;
}

std::string fromSeconds(double seconds) {
    TimePoint tp{std::chrono::microseconds(std::llround(seconds * 1e6))};
    return formatTimestamp(tp);
}

std::string calcTimestamp(const std::string& timestamp, double offset_seconds) {
    auto begin = parseTimestamp(timestamp);
    if (!begin) {
        throw std::invalid_argument("calcTimestamp: cannot parse timestamp '" +
                                    timestamp + "'");
    }
    
    TimePoint t = *begin + std::chrono::microseconds(
        std::llround(offset_seconds * 1e6));
    return formatTimestamp(t);
}

} // namespace pickassoc
