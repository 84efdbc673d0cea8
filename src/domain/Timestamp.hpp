/**
 * @file Timestamp.hpp
 * @brief ISO-8601 helpers for remote modification times and sync bookkeeping.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace notesync::domain {

using TimePoint = std::chrono::system_clock::time_point;

class Timestamp {
public:
    /**
     * @brief Parses "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]".
     * A missing zone designator is read as UTC.
     * @return std::nullopt when the text is not a timestamp.
     */
    static std::optional<TimePoint> Parse(const std::string& text);

    /** @brief Formats as "YYYY-MM-DDTHH:MM:SS[.ffffff]+00:00". */
    static std::string ToIso8601(TimePoint tp);

    /** @brief Formats as "YYYY-MM-DD HH:MM" in UTC, for human-facing output. */
    static std::string ToDisplay(TimePoint tp);

    static TimePoint Now() { return std::chrono::system_clock::now(); }
};

} // namespace notesync::domain
