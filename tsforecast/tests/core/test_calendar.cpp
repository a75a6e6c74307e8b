#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "tsforecast/core/calendar.hpp"
#include "tsforecast/core/frequency.hpp"

#include <stdexcept>
#include <string>

namespace calendar = tsforecast::core::calendar;
using tests::helpers::date;
using tsforecast::core::Frequency;

TEST_CASE("Civil day conversion round trips", "[core][calendar]") {
	REQUIRE(calendar::daysFromCivil({1970, 1, 1}) == 0);
	REQUIRE(calendar::daysFromCivil({1969, 12, 31}) == -1);
	REQUIRE(calendar::daysFromCivil({2000, 3, 1}) == 11017);

	for (std::int64_t days : {-80000LL, -1LL, 0LL, 59LL, 11016LL, 20000LL}) {
		const auto civil = calendar::civilFromDays(days);
		REQUIRE(calendar::daysFromCivil(civil) == days);
	}
}

TEST_CASE("Leap years and month lengths", "[core][calendar]") {
	REQUIRE(calendar::isLeapYear(2000));
	REQUIRE(calendar::isLeapYear(2024));
	REQUIRE_FALSE(calendar::isLeapYear(1900));
	REQUIRE(calendar::daysInMonth(2024, 2) == 29);
	REQUIRE(calendar::daysInMonth(2023, 2) == 28);
	REQUIRE(calendar::daysInMonth(2023, 4) == 30);
}

TEST_CASE("parseTimestamp accepts the supported spellings", "[core][calendar][parse]") {
	REQUIRE(calendar::parseTimestamp("1949") == date(1949, 1, 1));
	REQUIRE(calendar::parseTimestamp("1949-03") == date(1949, 3, 1));
	REQUIRE(calendar::parseTimestamp("1949/03") == date(1949, 3, 1));
	REQUIRE(calendar::parseTimestamp("2024-02-29") == date(2024, 2, 29));
	REQUIRE(calendar::parseTimestamp("2024/02/29") == date(2024, 2, 29));
	REQUIRE(calendar::parseTimestamp("12/31/2020") == date(2020, 12, 31));
	REQUIRE(calendar::parseTimestamp("1/5/2021") == date(2021, 1, 5));
	REQUIRE(calendar::parseTimestamp("2024-01-02T03:04") == date(2024, 1, 2, 3, 4));
	REQUIRE(calendar::parseTimestamp("2024-01-02 03:04:05") ==
	        date(2024, 1, 2, 3, 4) + std::chrono::seconds(5));
	REQUIRE(calendar::parseTimestamp("2024-01-02T03:04:05.250Z") ==
	        date(2024, 1, 2, 3, 4) + std::chrono::milliseconds(5250));
	REQUIRE(calendar::parseTimestamp("  2024-01-02  ") == date(2024, 1, 2));
}

TEST_CASE("parseTimestamp accepts short fields and UTC offsets", "[core][calendar][parse]") {
	REQUIRE(calendar::parseTimestamp("2024-1-5") == date(2024, 1, 5));
	REQUIRE(calendar::parseTimestamp("2024/1/5") == date(2024, 1, 5));
	REQUIRE(calendar::parseTimestamp("2024-11") == date(2024, 11, 1));
	REQUIRE(calendar::parseTimestamp("2024-01-05 9:30") == date(2024, 1, 5, 9, 30));
	REQUIRE(calendar::parseTimestamp("2024-01-05T10:00:00+00:00") == date(2024, 1, 5, 10));
	REQUIRE(calendar::parseTimestamp("2024-01-05T10:00:00+02:00") == date(2024, 1, 5, 8));
	REQUIRE(calendar::parseTimestamp("2024-01-05T10:00-05:30") == date(2024, 1, 5, 15, 30));
	REQUIRE(calendar::parseTimestamp("2024-01-05T01:00+0200") == date(2024, 1, 4, 23));
	REQUIRE(calendar::parseTimestamp("2024-01-05T10:00Z") == date(2024, 1, 5, 10));
}

TEST_CASE("parseTimestamp rejects malformed offsets", "[core][calendar][parse]") {
	for (const std::string text : {"2024-01-05+02:00", "2024-01-05T10:00+25:00", "2024-01-05T10:00:00+02:0",
	                               "2024-01-05T10:00:00+", "2024-01-05T10:00:00 +02:00", "2024-1-"}) {
		INFO(text);
		REQUIRE_FALSE(calendar::parseTimestamp(text).has_value());
	}
}

TEST_CASE("parseTimestamp is bounded by the time point range", "[core][calendar][parse]") {
	REQUIRE(calendar::parseTimestamp("2262-01-01") == date(2262, 1, 1));
	REQUIRE(calendar::parseTimestamp("1678-01-01") == date(1678, 1, 1));
	REQUIRE_FALSE(calendar::parseTimestamp("2262-04-12").has_value());
	REQUIRE_FALSE(calendar::parseTimestamp("1677-01-01").has_value());
	REQUIRE_THROWS_AS(date(2300, 1, 1), std::invalid_argument);
}

TEST_CASE("parseTimestamp rejects malformed dates", "[core][calendar][parse]") {
	for (const std::string text : {"", "abc", "2024-13-01", "2023-02-29", "2024-01-32", "2024-01-02T25:00",
	                               "2024-01-02T10", "2024-01-02x", "13/01/2024", "24-01-02", "3000-01-01",
	                               "1000-01-01"}) {
		INFO(text);
		REQUIRE_FALSE(calendar::parseTimestamp(text).has_value());
	}
}

TEST_CASE("formatTimestamp and toIsoString use UTC", "[core][calendar]") {
	const auto tp = date(1960, 12, 1, 13, 45);
	REQUIRE(calendar::formatTimestamp(tp, "%Y-%m") == "1960-12");
	REQUIRE(calendar::formatTimestamp(tp, "%Y-%m-%d") == "1960-12-01");
	REQUIRE(calendar::toIsoString(tp) == "1960-12-01T13:45:00Z");
	REQUIRE(calendar::parseTimestamp(calendar::toIsoString(tp)) == tp);
}

TEST_CASE("addMonths clamps the day and keeps the time of day", "[core][calendar]") {
	REQUIRE(calendar::addMonths(date(2024, 1, 31), 1) == date(2024, 2, 29));
	REQUIRE(calendar::addMonths(date(2023, 1, 31), 1) == date(2023, 2, 28));
	REQUIRE(calendar::addMonths(date(2024, 11, 15, 6), 3) == date(2025, 2, 15, 6));
	REQUIRE(calendar::addMonths(date(2024, 3, 1), -3) == date(2023, 12, 1));
	REQUIRE(calendar::addYears(date(2024, 2, 29), 1) == date(2025, 2, 28));
}

TEST_CASE("advance steps by one frequency unit", "[core][calendar][frequency]") {
	const auto start = date(2024, 1, 31);
	REQUIRE(tsforecast::core::advance(start, Frequency::Daily) == date(2024, 2, 1));
	REQUIRE(tsforecast::core::advance(start, Frequency::Weekly, 2) == date(2024, 2, 14));
	REQUIRE(tsforecast::core::advance(date(2024, 1, 1), Frequency::MonthStart, 13) == date(2025, 2, 1));
	REQUIRE(tsforecast::core::advance(date(2020, 1, 1), Frequency::YearStart, 3) == date(2023, 1, 1));
}

TEST_CASE("advance refuses to leave the supported date range", "[core][calendar][frequency]") {
	using tsforecast::core::advance;
	REQUIRE(advance(date(2262, 1, 1), Frequency::MonthStart, 3) == date(2262, 4, 1));
	REQUIRE(advance(date(2262, 4, 10), Frequency::Daily) == date(2262, 4, 11));

	REQUIRE_THROWS_AS(advance(date(2261, 1, 1), Frequency::YearStart, 100), std::invalid_argument);
	REQUIRE_THROWS_AS(advance(date(2262, 1, 1), Frequency::MonthStart, 4), std::invalid_argument);
	REQUIRE_THROWS_AS(advance(date(2261, 12, 1), Frequency::Weekly, 100), std::invalid_argument);
	REQUIRE_THROWS_AS(advance(date(2262, 4, 10), Frequency::Daily, 2), std::invalid_argument);
	REQUIRE_THROWS_AS(advance(date(1700, 1, 1), Frequency::YearStart, -30), std::invalid_argument);
	REQUIRE_THROWS_AS(calendar::addDays(date(2000, 1, 1), 300000), std::invalid_argument);
}

TEST_CASE("Frequency codes round trip", "[core][frequency]") {
	for (auto frequency : {Frequency::Daily, Frequency::Weekly, Frequency::MonthStart, Frequency::YearStart}) {
		REQUIRE(tsforecast::core::frequencyFromCode(tsforecast::core::frequencyCode(frequency)) == frequency);
	}
	REQUIRE(tsforecast::core::frequencyCode(Frequency::MonthStart) == "MS");
	REQUIRE_FALSE(tsforecast::core::frequencyFromCode("Q").has_value());
}
