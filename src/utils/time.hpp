#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>


/*
------------------------------------------------------------------------------
  TIMESTAMP COMMENT
------------------------------------------------------------------------------

Every stored properties file traditionally starts its data section with a
comment line holding the wall-clock time of the store call:

    #Sun Oct 18 14:03:22 CEST 2026

The layout is fixed: "Www Mmm dd hh:mm:ss ZZZ yyyy", local time, English
day/month abbreviations. Other tools do not parse this line, but keeping the
exact shape makes our output diff-identical to theirs (modulo the time).

std::chrono::system_clock is the right clock here: we want calendar time,
not a monotonic duration.
------------------------------------------------------------------------------
*/

/**
 * @brief Renders the given point in time in the timestamp comment layout.
 *
 * Uses localtime_r + strftime with the "C" abbreviations; the zone name
 * comes from the process TZ setting.
 */
inline std::string formatDateComment(std::chrono::system_clock::time_point when) {
    static const char* const days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char clock[16];
    std::strftime(clock, sizeof(clock), "%H:%M:%S", &local);
    char zone[16];
    std::strftime(zone, sizeof(zone), "%Z", &local);
    char day[4];
    std::snprintf(day, sizeof(day), "%02d", local.tm_mday);

    std::string out;
    out += days[local.tm_wday];
    out += ' ';
    out += months[local.tm_mon];
    out += ' ';
    out += day;
    out += ' ';
    out += clock;
    out += ' ';
    out += zone;
    out += ' ';
    out += std::to_string(local.tm_year + 1900);
    return out;
}

/**
 * @brief Current local time in the timestamp comment layout.
 */
inline std::string currentDateComment() {
    return formatDateComment(std::chrono::system_clock::now());
}
