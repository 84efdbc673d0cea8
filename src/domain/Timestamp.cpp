/**
 * @file Timestamp.cpp
 * @brief Implementation of Timestamp.
 */

#include "domain/Timestamp.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace notesync::domain {

namespace {

std::time_t ToTimeT(std::tm& tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

std::tm ToUtc(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

bool ReadDigits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

std::optional<TimePoint> Timestamp::Parse(const std::string& text) {
    // Fixed prefix: YYYY-MM-DDTHH:MM:SS
    int year, month, day, hour, minute, second;
    if (text.size() < 19) return std::nullopt;
    if (!ReadDigits(text, 0, 4, year) || text[4] != '-' ||
        !ReadDigits(text, 5, 2, month) || text[7] != '-' ||
        !ReadDigits(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ') ||
        !ReadDigits(text, 11, 2, hour) || text[13] != ':' ||
        !ReadDigits(text, 14, 2, minute) || text[16] != ':' ||
        !ReadDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }

    long offsetSeconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0, om = 0;
            if (!ReadDigits(text, pos + 1, 2, oh)) return std::nullopt;
            size_t minutesAt = pos + 3;
            if (minutesAt < text.size() && text[minutesAt] == ':') ++minutesAt;
            if (!ReadDigits(text, minutesAt, 2, om)) return std::nullopt;
            offsetSeconds = (oh * 3600L + om * 60L) * (zone == '+' ? 1 : -1);
            pos = minutesAt + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t tt = ToTimeT(tm);
    if (tt == static_cast<std::time_t>(-1)) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(tt - offsetSeconds);
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros));
}

std::string Timestamp::ToIso8601(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) secs -= std::chrono::seconds(1);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();

    std::tm tm = ToUtc(std::chrono::system_clock::to_time_t(secs));
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out = buf;
    if (micros != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(micros));
        out += frac;
    }
    return out + "+00:00";
}

std::string Timestamp::ToDisplay(TimePoint tp) {
    std::tm tm = ToUtc(std::chrono::system_clock::to_time_t(tp));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

} // namespace notesync::domain
