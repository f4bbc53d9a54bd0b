#pragma once
#include <chrono>
#include <string>

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Time helpers shared by the store codec, the scheduler and the stats views.
//
// An unset timestamp is the default-constructed Timestamp{}; on disk it is written
// as the zero time "0001-01-01T00:00:00Z" so files stay readable by other tools.
namespace TimeUtils {

    // Fractional days from `from` to `to` (negative when `to` is earlier).
    double daysBetween(Timestamp from, Timestamp to);

    // RFC 3339 in UTC with nanosecond precision, e.g. 2024-05-01T10:00:00.5Z
    std::string formatRfc3339(Timestamp ts);

    // Accepts "Z" or "+hh:mm"/"-hh:mm" offsets and optional fractional seconds.
    // Throws ValidationError on malformed input.
    Timestamp parseRfc3339(const std::string& text);

    // Strict YYYY-MM-DD, interpreted as midnight UTC. Throws ValidationError.
    Timestamp parseDate(const std::string& text);
    std::string formatDate(Timestamp ts);

    // Midnight of the local calendar day containing ts.
    Timestamp startOfLocalDay(Timestamp ts);

    // Midnight UTC of the day containing ts (due dates are stored as UTC dates).
    Timestamp startOfUtcDay(Timestamp ts);

    bool isUnset(Timestamp ts);
}
