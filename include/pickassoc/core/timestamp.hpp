#pragma once

#include "types.hpp"
#include <optional>
#include <string>

namespace pickassoc {

/**
 * Timestamp helpers
 *
 * Picks and begin times travel as text in the fixed millisecond format
 *   YYYY-MM-DDTHH:MM:SS.mmm
 * Parsing also accepts a space separator, any number of fractional digits
 * (truncated to microseconds) and a trailing "Z" or "+HH:MM" UTC offset.
 */

// Parse a timestamp, std::nullopt if the text is malformed
std::optional<TimePoint> parseTimestamp(const std::string& text);

// Format with millisecond precision (truncated, not rounded)
std::string formatTimestamp(TimePoint time);

// Seconds since the Unix epoch
double toSeconds(TimePoint time);

// Unix seconds to formatted timestamp
std::string fromSeconds(double seconds);

// Advance a formatted timestamp by offset_seconds (microsecond resolution).
// Throws std::invalid_argument if the timestamp cannot be parsed.
std::string calcTimestamp(const std::string& timestamp, double offset_seconds);

// Zero epoch in the pick timestamp format
inline const std::string& epochTimestamp() {
    static const std::string epoch = "1970-01-01T00:00:00.000";
    return epoch;
}

} // namespace pickassoc
