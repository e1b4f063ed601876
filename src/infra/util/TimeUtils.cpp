#include "TimeUtils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

#include "Errors.hpp"

namespace flowgraph::util {

namespace {

int ParseDigits(std::string_view text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        throw ValidationError("timestamp too short: " + std::string(text));
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw ValidationError("malformed timestamp: " + std::string(text));
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

}  // namespace

TimePoint Now() {
    return Clock::now();
}

std::string FormatTimestamp(TimePoint tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = (since_epoch - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(nanos));
    return buf;
}

TimePoint ParseTimestamp(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 20 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':') {
        throw ValidationError("malformed timestamp: " + std::string(text));
    }

    std::tm tm{};
    tm.tm_year = ParseDigits(text, 0, 4) - 1900;
    tm.tm_mon = ParseDigits(text, 5, 2) - 1;
    tm.tm_mday = ParseDigits(text, 8, 2);
    tm.tm_hour = ParseDigits(text, 11, 2);
    tm.tm_min = ParseDigits(text, 14, 2);
    tm.tm_sec = ParseDigits(text, 17, 2);

    size_t pos = 19;
    int64_t nanos = 0;
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
        if (digits == 0) throw ValidationError("malformed timestamp fraction: " + std::string(text));
        for (; digits < 9; ++digits) nanos *= 10;
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        if (pos + 6 > text.size() || text[pos + 3] != ':') {
            throw ValidationError("malformed timestamp offset: " + std::string(text));
        }
        offset_seconds = sign * (ParseDigits(text, pos + 1, 2) * 3600 + ParseDigits(text, pos + 4, 2) * 60);
        pos += 6;
    } else {
        throw ValidationError("timestamp missing zone designator: " + std::string(text));
    }

    if (pos != text.size()) {
        throw ValidationError("trailing characters in timestamp: " + std::string(text));
    }

    std::time_t t = timegm(&tm);
    return TimePoint{} + std::chrono::duration_cast<Clock::duration>(
                             std::chrono::seconds(static_cast<int64_t>(t) - offset_seconds) +
                             std::chrono::nanoseconds(nanos));
}

}  // namespace flowgraph::util
