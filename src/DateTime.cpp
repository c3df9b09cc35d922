/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/DateTime.hpp"
#include "electionguard/Exception.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace electionguard {

static bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if(month == 2 && isLeapYear(year)) return 29;
    return days[month-1];
}

DateTime::DateTime(int year, int month, int day,
                   int hour, int minute, int second,
                   int microsecond,
                   std::optional<int> utc_offset_minutes)
: m_year(year)
, m_month(month)
, m_day(day)
, m_hour(hour)
, m_minute(minute)
, m_second(second)
, m_microsecond(microsecond)
, m_offset(utc_offset_minutes) {
    if(year < 1 || year > 9999)
        throw Exception{"Year out of range: " + std::to_string(year)};
    if(month < 1 || month > 12)
        throw Exception{"Month out of range: " + std::to_string(month)};
    if(day < 1 || day > daysInMonth(year, month))
        throw Exception{"Day out of range: " + std::to_string(day)};
    if(hour < 0 || hour > 23)
        throw Exception{"Hour out of range: " + std::to_string(hour)};
    if(minute < 0 || minute > 59)
        throw Exception{"Minute out of range: " + std::to_string(minute)};
    if(second < 0 || second > 59)
        throw Exception{"Second out of range: " + std::to_string(second)};
    if(microsecond < 0 || microsecond > 999999)
        throw Exception{"Microsecond out of range: " + std::to_string(microsecond)};
    if(m_offset && (*m_offset <= -24*60 || *m_offset >= 24*60))
        throw Exception{"UTC offset out of range: " + std::to_string(*m_offset)};
}

namespace {

struct Cursor {

    std::string_view text;
    std::size_t      pos = 0;

    bool done() const { return pos == text.size(); }

    char peek() const { return done() ? '\0' : text[pos]; }

    bool accept(char c) {
        if(peek() != c) return false;
        ++pos;
        return true;
    }

    int digits(std::size_t count) {
        if(pos + count > text.size()) fail();
        int value = 0;
        for(std::size_t i = 0; i < count; ++i) {
            char c = text[pos+i];
            if(c < '0' || c > '9') fail();
            value = 10*value + (c - '0');
        }
        pos += count;
        return value;
    }

    void expect(char c) {
        if(!accept(c)) fail();
    }

    [[noreturn]] void fail() const {
        throw ParseError{"Invalid ISO-8601 date: \"" + std::string{text} + "\""};
    }
};

}

DateTime DateTime::Parse(std::string_view text) {
    Cursor cursor{text};
    int year = cursor.digits(4);
    cursor.expect('-');
    int month = cursor.digits(2);
    cursor.expect('-');
    int day = cursor.digits(2);

    int hour = 0, minute = 0, second = 0, microsecond = 0;
    std::optional<int> offset;

    if(cursor.accept('T') || cursor.accept('t') || cursor.accept(' ')) {
        hour = cursor.digits(2);
        cursor.expect(':');
        minute = cursor.digits(2);
        if(cursor.accept(':')) {
            second = cursor.digits(2);
            if(cursor.accept('.') || cursor.accept(',')) {
                // digits beyond microseconds are dropped
                std::size_t count = 0;
                while(cursor.peek() >= '0' && cursor.peek() <= '9') {
                    if(count < 6) microsecond = 10*microsecond + (cursor.peek() - '0');
                    ++cursor.pos;
                    ++count;
                }
                if(count == 0) cursor.fail();
                for(; count < 6; ++count) microsecond *= 10;
            }
        }
        if(cursor.accept('Z') || cursor.accept('z')) {
            offset = 0;
        } else if(cursor.peek() == '+' || cursor.peek() == '-') {
            int sign = cursor.peek() == '-' ? -1 : 1;
            ++cursor.pos;
            int off_hours = cursor.digits(2);
            int off_minutes = 0;
            if(!cursor.done()) {
                cursor.accept(':');
                off_minutes = cursor.digits(2);
            }
            if(off_minutes > 59) cursor.fail();
            offset = sign*(60*off_hours + off_minutes);
        }
    }
    if(!cursor.done()) cursor.fail();

    try {
        return DateTime{year, month, day, hour, minute, second, microsecond, offset};
    } catch(const Exception& ex) {
        throw ParseError{"Invalid ISO-8601 date \"" + std::string{text} + "\": " + ex.what()};
    }
}

std::string DateTime::toIsoFormat() const {
    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << m_year << '-'
       << std::setw(2) << m_month << '-'
       << std::setw(2) << m_day << 'T'
       << std::setw(2) << m_hour << ':'
       << std::setw(2) << m_minute << ':'
       << std::setw(2) << m_second;
    if(m_microsecond != 0)
        ss << '.' << std::setw(6) << m_microsecond;
    if(m_offset) {
        int off = *m_offset;
        ss << (off < 0 ? '-' : '+');
        off = std::abs(off);
        ss << std::setw(2) << off / 60 << ':' << std::setw(2) << off % 60;
    }
    return ss.str();
}

bool DateTime::operator==(const DateTime& other) const {
    return m_year == other.m_year
        && m_month == other.m_month
        && m_day == other.m_day
        && m_hour == other.m_hour
        && m_minute == other.m_minute
        && m_second == other.m_second
        && m_microsecond == other.m_microsecond
        && m_offset == other.m_offset;
}

}
