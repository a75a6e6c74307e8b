#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tsforecast::core::calendar {

using TimePoint = std::chrono::system_clock::time_point;

/// Proleptic Gregorian date in UTC.
struct CivilDate {
	int year = 1970;
	int month = 1;
	int day = 1;
};

/// Civil date plus wall-clock time in UTC.
struct CivilDateTime {
	CivilDate date;
	int hour = 0;
	int minute = 0;
	int second = 0;
	int millisecond = 0;
};

bool isLeapYear(int year);
int daysInMonth(int year, int month);

/// Days since 1970-01-01 for a civil date (negative before the epoch).
std::int64_t daysFromCivil(const CivilDate &date);
CivilDate civilFromDays(std::int64_t days);

/**
 * @throws std::invalid_argument For an invalid date or one outside the range
 *         of TimePoint (roughly 1677-09-21 to 2262-04-11).
 */
TimePoint toTimePoint(const CivilDateTime &value);
CivilDateTime toCivil(const TimePoint &tp);

/// Midnight of the day containing @p tp.
TimePoint startOfDay(const TimePoint &tp);

/// @throws std::invalid_argument If the result leaves the range of TimePoint.
TimePoint addDays(const TimePoint &tp, std::int64_t days);

/**
 * @brief Shifts a time point by whole calendar months, keeping the time of day.
 *
 * The day of month is clamped to the length of the target month.
 * @throws std::invalid_argument If the result leaves the range of TimePoint.
 */
TimePoint addMonths(const TimePoint &tp, int months);
TimePoint addYears(const TimePoint &tp, int years);

/**
 * @brief Parses the date/time spellings accepted in uploaded tables.
 *
 * Accepted: YYYY, YYYY-M, YYYY/M, YYYY-M-D, YYYY/M/D and M/D/YYYY (month and
 * day with one or two digits), each optionally followed by 'T' or ' ' and
 * H:MM[:SS[.fff]]. A time may carry 'Z' or a +HH:MM / -HH:MM offset, and the
 * result is shifted to UTC. Surrounding whitespace is ignored.
 * @return std::nullopt when the text is not a valid date or does not fit a TimePoint.
 */
std::optional<TimePoint> parseTimestamp(const std::string &text);

/**
 * @brief Formats a time point with strftime conversion specifiers, in UTC.
 */
std::string formatTimestamp(const TimePoint &tp, const std::string &format);

/// ISO-8601 form used by the persisted artifacts ("%Y-%m-%dT%H:%M:%SZ").
std::string toIsoString(const TimePoint &tp);

} // namespace tsforecast::core::calendar
