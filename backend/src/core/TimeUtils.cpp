#include "TimeUtils.hpp"
#include "Errors.hpp"
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

    constexpr std::int64_t SECONDS_PER_DAY = 24 * 60 * 60;
    const char* const ZERO_TIME = "0001-01-01T00:00:00Z";

    // Proleptic Gregorian conversions (days relative to 1970-01-01).
    std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
    }

    std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
        std::int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }

    bool isLeap(std::int64_t y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    unsigned daysInMonth(std::int64_t y, unsigned m) {
        static const unsigned table[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
        if (m == 2 && isLeap(y)) return 29;
        return table[m - 1];
    }

    // Reads exactly `width` digits at `pos`, advancing it.
    bool readDigits(const std::string& s, size_t& pos, size_t width, int& out) {
        if (pos + width > s.size()) return false;
        int value = 0;
        for (size_t i = 0; i < width; ++i) {
            char c = s[pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        pos += width;
        out = value;
        return true;
    }

    bool expect(const std::string& s, size_t& pos, char c) {
        if (pos >= s.size() || s[pos] != c) return false;
        ++pos;
        return true;
    }

    Timestamp fromParts(std::int64_t days, std::int64_t secondsOfDay, std::int64_t nanos) {
        // Clock::duration is nanoseconds on the supported toolchains; stay inside its range.
        if (days < -106000 || days > 106000) {
            throw ValidationError("timestamp out of supported range");
        }
        auto since_epoch = std::chrono::seconds(days * SECONDS_PER_DAY + secondsOfDay)
            + std::chrono::nanoseconds(nanos);
        return Timestamp(std::chrono::duration_cast<Clock::duration>(since_epoch));
    }
}

namespace TimeUtils {

    double daysBetween(Timestamp from, Timestamp to) {
        using days_d = std::chrono::duration<double, std::ratio<SECONDS_PER_DAY>>;
        return std::chrono::duration_cast<days_d>(to - from).count();
    }

    bool isUnset(Timestamp ts) {
        return ts == Timestamp{};
    }

    std::string formatRfc3339(Timestamp ts) {
        if (isUnset(ts)) return ZERO_TIME;

        std::int64_t total_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
        std::int64_t secs = floorDiv(total_ns, 1000000000);
        std::int64_t nanos = total_ns - secs * 1000000000;
        std::int64_t days = floorDiv(secs, SECONDS_PER_DAY);
        std::int64_t sod = secs - days * SECONDS_PER_DAY;

        std::int64_t y; unsigned m, d;
        civilFromDays(days, y, m, d);

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << y << "-"
            << std::setw(2) << m << "-"
            << std::setw(2) << d << "T"
            << std::setw(2) << sod / 3600 << ":"
            << std::setw(2) << (sod % 3600) / 60 << ":"
            << std::setw(2) << sod % 60;

        if (nanos != 0) {
            std::ostringstream frac;
            frac << std::setfill('0') << std::setw(9) << nanos;
            std::string f = frac.str();
            while (!f.empty() && f.back() == '0') f.pop_back();
            oss << "." << f;
        }
        oss << "Z";
        return oss.str();
    }

    Timestamp parseRfc3339(const std::string& text) {
        if (text == ZERO_TIME) return Timestamp{};

        size_t pos = 0;
        int year, month, day, hour, minute, second;
        bool ok = readDigits(text, pos, 4, year) && expect(text, pos, '-')
            && readDigits(text, pos, 2, month) && expect(text, pos, '-')
            && readDigits(text, pos, 2, day);
        if (ok) {
            ok = pos < text.size() && (text[pos] == 'T' || text[pos] == 't');
            ++pos;
        }
        ok = ok && readDigits(text, pos, 2, hour) && expect(text, pos, ':')
            && readDigits(text, pos, 2, minute) && expect(text, pos, ':')
            && readDigits(text, pos, 2, second);
        if (!ok) throw ValidationError("malformed timestamp '" + text + "'");

        std::int64_t nanos = 0;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 9) {
                    nanos = nanos * 10 + (text[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) throw ValidationError("malformed fractional seconds in '" + text + "'");
            for (; digits < 9; ++digits) nanos *= 10;
        }

        std::int64_t offset_seconds = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh, om;
            if (!readDigits(text, pos, 2, oh) || !expect(text, pos, ':') || !readDigits(text, pos, 2, om))
                throw ValidationError("malformed offset in '" + text + "'");
            offset_seconds = sign * (oh * 3600 + om * 60);
        }
        else {
            throw ValidationError("timestamp '" + text + "' lacks a zone offset");
        }
        if (pos != text.size()) throw ValidationError("trailing characters in timestamp '" + text + "'");

        if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)
            || hour > 23 || minute > 59 || second > 60) {
            throw ValidationError("timestamp '" + text + "' is out of range");
        }

        std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        std::int64_t sod = hour * 3600 + minute * 60 + second - offset_seconds;
        return fromParts(days, sod, nanos);
    }

    Timestamp parseDate(const std::string& text) {
        size_t pos = 0;
        int year, month, day;
        bool ok = readDigits(text, pos, 4, year) && expect(text, pos, '-')
            && readDigits(text, pos, 2, month) && expect(text, pos, '-')
            && readDigits(text, pos, 2, day) && pos == text.size();
        if (!ok || month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) {
            throw ValidationError("Invalid date format: " + text + ". Use YYYY-MM-DD.");
        }
        return fromParts(daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)), 0, 0);
    }

    std::string formatDate(Timestamp ts) {
        return formatRfc3339(startOfUtcDay(ts)).substr(0, 10);
    }

    Timestamp startOfUtcDay(Timestamp ts) {
        std::int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
        if (ts.time_since_epoch() < Clock::duration::zero()
            && std::chrono::seconds(secs) != ts.time_since_epoch()) {
            --secs;
        }
        return fromParts(floorDiv(secs, SECONDS_PER_DAY), 0, 0);
    }

    Timestamp startOfLocalDay(Timestamp ts) {
        std::time_t t = Clock::to_time_t(ts);
        std::tm local{};
        localtime_r(&t, &local);
        local.tm_hour = 0;
        local.tm_min = 0;
        local.tm_sec = 0;
        local.tm_isdst = -1;
        return Clock::from_time_t(std::mktime(&local));
    }
}
