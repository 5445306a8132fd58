#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace etabar {
namespace render {

struct TimeUnit {
    std::int64_t seconds;
    const char* singular;
    const char* plural;
};

// Calendar-naive: a year is 365 days and a month is 30 days.
constexpr std::array<TimeUnit, 7> TIME_UNITS = {{
    {31536000, "year", "years"},
    {2592000, "month", "months"},
    {604800, "week", "weeks"},
    {86400, "day", "days"},
    {3600, "hour", "hours"},
    {60, "minute", "minutes"},
    {1, "second", "seconds"}
}};

/**
 * Breaks a second count into "<n> <unit>" terms, largest unit first,
 * e.g. 3661 -> "1 hour 1 minute 1 second". Zero-count units are skipped;
 * zero or negative input yields "0 seconds".
 */
std::string humanize(std::int64_t seconds);

}}
