#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "tsforecast/core/time_series.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using tsforecast::core::Frequency;
using tsforecast::core::TimeSeries;
using tests::helpers::date;

TEST_CASE("TimeSeries stores values, label and frequency", "[core][time_series]") {
	const auto ts = tests::helpers::makeSeries({1.0, 2.0, 3.0}, date(2024, 1, 1), Frequency::Daily, "sales");

	REQUIRE(ts.size() == 3);
	REQUIRE_FALSE(ts.isEmpty());
	REQUIRE(ts.label() == "sales");
	REQUIRE(ts.frequency() == Frequency::Daily);
	REQUIRE(ts.firstTimestamp() == date(2024, 1, 1));
	REQUIRE(ts.lastTimestamp() == date(2024, 1, 3));
	REQUIRE(ts.getValues() == std::vector<double>{1.0, 2.0, 3.0});
}

TEST_CASE("TimeSeries rejects mismatched or unordered input", "[core][time_series]") {
	const auto stamps = tests::helpers::makeTimestamps(date(2024, 1, 1), 3, Frequency::Daily);

	REQUIRE_THROWS_AS(TimeSeries(stamps, {1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeries({stamps[1], stamps[0], stamps[2]}, {1.0, 2.0, 3.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeries({stamps[0], stamps[0], stamps[2]}, {1.0, 2.0, 3.0}), std::invalid_argument);
}

TEST_CASE("TimeSeries slice keeps label, frequency and metadata", "[core][time_series]") {
	auto ts = tests::helpers::makeMonthlySeries({1.0, 2.0, 3.0, 4.0, 5.0});
	ts.setMetadata({{"time_column", "Month"}});

	const auto part = ts.slice(1, 4);
	REQUIRE(part.size() == 3);
	REQUIRE(part.getValues() == std::vector<double>{2.0, 3.0, 4.0});
	REQUIRE(part.firstTimestamp() == date(1949, 2, 1));
	REQUIRE(part.frequency() == Frequency::MonthStart);
	REQUIRE(part.metadata().at("time_column") == "Month");

	REQUIRE_THROWS_AS(ts.slice(3, 2), std::invalid_argument);
	REQUIRE_THROWS_AS(ts.slice(0, 6), std::out_of_range);
}

TEST_CASE("TimeSeries reports missing values and empty access", "[core][time_series][edge]") {
	const auto ts = tests::helpers::makeDailySeries({1.0, std::numeric_limits<double>::quiet_NaN(), 3.0});
	REQUIRE(ts.hasMissingValues());

	const TimeSeries empty({}, {});
	REQUIRE(empty.isEmpty());
	REQUIRE_THROWS_AS(empty.firstTimestamp(), std::out_of_range);
	REQUIRE_THROWS_AS(empty.lastTimestamp(), std::out_of_range);
}
