/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_DATE_TIME_HPP
#define ELECTIONGUARD_DATE_TIME_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Exception.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace electionguard {

/**
 * @brief Calendar date and time with microsecond precision and an
 * optional offset from UTC. Two DateTime objects are equal when all
 * their fields are equal (the same instant expressed with different
 * offsets is not considered equal).
 */
class DateTime {

    public:

    DateTime() = default;

    /**
     * @brief Constructor. Throws an Exception if any field is out of range.
     */
    DateTime(int year, int month, int day,
             int hour = 0, int minute = 0, int second = 0,
             int microsecond = 0,
             std::optional<int> utc_offset_minutes = std::nullopt);

    /**
     * @brief Parses an ISO-8601 date or date-time, e.g.
     * "2022-03-01", "2022-03-01T12:30", "2022-03-01 12:30:05.25Z",
     * "2022-03-01T12:30:05+01:00". Throws a ParseError on failure.
     */
    static DateTime Parse(std::string_view text);

    /**
     * @brief ISO-8601 form "YYYY-MM-DDTHH:MM:SS", followed by
     * ".ffffff" if microseconds are not 0, and by "+HH:MM"
     * if the DateTime has an offset.
     */
    std::string toIsoFormat() const;

    int year() const { return m_year; }
    int month() const { return m_month; }
    int day() const { return m_day; }
    int hour() const { return m_hour; }
    int minute() const { return m_minute; }
    int second() const { return m_second; }
    int microsecond() const { return m_microsecond; }
    const std::optional<int>& utcOffsetMinutes() const { return m_offset; }

    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }

    private:

    int m_year = 1970;
    int m_month = 1;
    int m_day = 1;
    int m_hour = 0;
    int m_minute = 0;
    int m_second = 0;
    int m_microsecond = 0;
    std::optional<int> m_offset;
};

}

#endif
