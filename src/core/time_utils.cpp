#include <squirrel/core/time_utils.h>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace squirrel::core {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool readDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size())
        return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c)
        return false;
    ++pos;
    return true;
}

Error badTimestamp(std::string_view text) {
    return Error{ErrorCode::InvalidData, "Invalid RFC 3339 timestamp: '" + std::string(text) + "'"};
}

} // namespace

std::string formatRfc3339(TimePoint tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - secs).count();
    const std::time_t tt = static_cast<std::time_t>(secs.time_since_epoch().count());

    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &tt);
#else
    gmtime_r(&tt, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(9) << nanos << 'Z';
    return oss.str();
}

// Parsed by hand rather than with std::get_time so fractional seconds survive formatRfc3339 round trips.
Result<TimePoint> parseRfc3339(std::string_view text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return badTimestamp(text);
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' '))
        return badTimestamp(text);
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return badTimestamp(text);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return badTimestamp(text);
    }

    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9)
                nanos = nanos * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9)
            return badTimestamp(text);
        for (std::size_t i = digits; i < 9; ++i)
            nanos *= 10;
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int oh = 0, om = 0;
        if (!readDigits(text, pos, 2, oh) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, om) || oh > 23 || om > 59) {
            return badTimestamp(text);
        }
        offsetSeconds = sign * (oh * 3600 + om * 60);
    } else {
        return badTimestamp(text);
    }
    if (pos != text.size())
        return badTimestamp(text);

    const int64_t days =
        daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t epochSeconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;

    const auto sinceEpoch = std::chrono::seconds(epochSeconds) + std::chrono::nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(sinceEpoch));
}

int64_t unixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::floor<std::chrono::seconds>(tp).time_since_epoch())
        .count();
}

int64_t nowUnixSeconds() {
    return unixSeconds(std::chrono::system_clock::now());
}

} // namespace squirrel::core
