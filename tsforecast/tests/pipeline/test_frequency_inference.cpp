#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "tsforecast/pipeline/frequency_inference.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using tsforecast::core::Frequency;
using tsforecast::pipeline::FrequencyInference;
using tsforecast::pipeline::FrequencyRule;
using namespace tests::helpers;

TEST_CASE("Exact spacings are detected by their own rules", "[pipeline][frequency]") {
	const FrequencyInference inference;

	auto decision = inference.infer(makeTimestamps(date(2024, 1, 1), 10, Frequency::Daily));
	REQUIRE(decision.frequency == Frequency::Daily);
	REQUIRE(decision.rule == "exact-daily");

	decision = inference.infer(makeTimestamps(date(2024, 1, 3), 10, Frequency::Weekly));
	REQUIRE(decision.frequency == Frequency::Weekly);
	REQUIRE(decision.rule == "exact-weekly");

	decision = inference.infer(makeTimestamps(date(1949, 1, 1), 24, Frequency::MonthStart));
	REQUIRE(decision.frequency == Frequency::MonthStart);
	REQUIRE(decision.rule == "exact-month-start");

	decision = inference.infer(makeTimestamps(date(2000, 1, 1), 12, Frequency::YearStart));
	REQUIRE(decision.frequency == Frequency::YearStart);
	REQUIRE(decision.rule == "exact-year-start");
}

TEST_CASE("Irregular spacing falls back to the median gap", "[pipeline][frequency]") {
	const FrequencyInference inference;

	std::vector<TimePoint> daily_with_gaps = {date(2024, 1, 1), date(2024, 1, 2), date(2024, 1, 4),
	                                          date(2024, 1, 5), date(2024, 1, 6)};
	auto decision = inference.infer(daily_with_gaps);
	REQUIRE(decision.frequency == Frequency::Daily);
	REQUIRE(decision.rule == "median-gap");

	std::vector<TimePoint> month_ends = {date(2020, 1, 31), date(2020, 2, 29), date(2020, 3, 31),
	                                     date(2020, 4, 30), date(2020, 5, 31)};
	decision = inference.infer(month_ends);
	REQUIRE(decision.frequency == Frequency::MonthStart);
	REQUIRE(decision.rule == "median-gap");

	std::vector<TimePoint> mid_year = {date(2000, 7, 1), date(2001, 7, 1), date(2002, 7, 1)};
	REQUIRE(inference.infer(mid_year).frequency == Frequency::YearStart);
}

TEST_CASE("Median gap classification thresholds", "[pipeline][frequency]") {
	using std::chrono::hours;
	const auto classify = [](hours gap) {
		return FrequencyInference::classifyMedianGap(std::chrono::duration_cast<TimePoint::duration>(gap));
	};
	REQUIRE(classify(hours(6)) == Frequency::Daily);
	REQUIRE(classify(hours(24)) == Frequency::Daily);
	REQUIRE(classify(hours(36)) == Frequency::Daily);
	REQUIRE(classify(hours(48)) == Frequency::Weekly);
	REQUIRE(classify(hours(24 * 7)) == Frequency::Weekly);
	REQUIRE(classify(hours(24 * 8)) == Frequency::MonthStart);
	REQUIRE(classify(hours(24 * 31)) == Frequency::MonthStart);
	REQUIRE(classify(hours(24 * 32)) == Frequency::YearStart);
}

TEST_CASE("The first matching rule wins", "[pipeline][frequency]") {
	const auto stamps = makeTimestamps(date(2024, 1, 1), 5, Frequency::Daily);

	std::vector<FrequencyRule> rules = FrequencyInference::defaultRules();
	rules.insert(rules.begin(), FrequencyRule{"always-weekly", [](const std::vector<TimePoint> &) {
		                                          return std::optional<Frequency>(Frequency::Weekly);
	                                          }});
	const auto decision = FrequencyInference(rules).infer(stamps);
	REQUIRE(decision.frequency == Frequency::Weekly);
	REQUIRE(decision.rule == "always-weekly");

	REQUIRE(FrequencyInference::defaultRules().back().name == "median-gap");
	REQUIRE(FrequencyInference().rules().size() == 5);
}

TEST_CASE("Frequency inference input errors", "[pipeline][frequency][edge]") {
	REQUIRE_THROWS_AS(FrequencyInference().infer({date(2024, 1, 1)}), std::invalid_argument);
	REQUIRE_THROWS_AS(FrequencyInference(std::vector<FrequencyRule>{})
	                      .infer(makeTimestamps(date(2024, 1, 1), 3, Frequency::Daily)),
	                  std::invalid_argument);
}
