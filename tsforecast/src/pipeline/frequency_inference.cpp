#include "tsforecast/pipeline/frequency_inference.hpp"

#include "tsforecast/core/calendar.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tsforecast::pipeline {

namespace {

using TimePoint = FrequencyInference::TimePoint;
using Duration = TimePoint::duration;

std::vector<Duration> gaps(const std::vector<TimePoint> &timestamps) {
	std::vector<Duration> out;
	out.reserve(timestamps.size() - 1);
	for (std::size_t i = 1; i < timestamps.size(); ++i) {
		out.push_back(timestamps[i] - timestamps[i - 1]);
	}
	return out;
}

FrequencyRule::Matcher fixedGap(Duration gap, core::Frequency frequency) {
	return [gap, frequency](const std::vector<TimePoint> &timestamps) -> std::optional<core::Frequency> {
		const auto all = gaps(timestamps);
		if (std::all_of(all.begin(), all.end(), [gap](Duration d) { return d == gap; })) {
			return frequency;
		}
		return std::nullopt;
	};
}

bool isMidnight(const core::calendar::CivilDateTime &civil) {
	return civil.hour == 0 && civil.minute == 0 && civil.second == 0 && civil.millisecond == 0;
}

// Consecutive first-of-period midnights, @p months apart.
FrequencyRule::Matcher periodStart(int months, core::Frequency frequency) {
	return [months, frequency](const std::vector<TimePoint> &timestamps) -> std::optional<core::Frequency> {
		for (std::size_t i = 0; i < timestamps.size(); ++i) {
			const auto civil = core::calendar::toCivil(timestamps[i]);
			if (civil.date.day != 1 || !isMidnight(civil) || (months == 12 && civil.date.month != 1)) {
				return std::nullopt;
			}
			if (i > 0 && core::calendar::addMonths(timestamps[i - 1], months) != timestamps[i]) {
				return std::nullopt;
			}
		}
		return frequency;
	};
}

std::optional<core::Frequency> medianGap(const std::vector<TimePoint> &timestamps) {
	auto all = gaps(timestamps);
	std::sort(all.begin(), all.end());
	const std::size_t mid = all.size() / 2;
	const Duration median = all.size() % 2 == 1 ? all[mid] : all[mid - 1] + (all[mid] - all[mid - 1]) / 2;
	return FrequencyInference::classifyMedianGap(median);
}

} // namespace

FrequencyInference::FrequencyInference() : rules_(defaultRules()) {
}

FrequencyInference::FrequencyInference(std::vector<FrequencyRule> rules) : rules_(std::move(rules)) {
}

std::vector<FrequencyRule> FrequencyInference::defaultRules() {
	using std::chrono::hours;
	return {
	    {"exact-daily", fixedGap(std::chrono::duration_cast<Duration>(hours(24)), core::Frequency::Daily)},
	    {"exact-weekly", fixedGap(std::chrono::duration_cast<Duration>(hours(24 * 7)), core::Frequency::Weekly)},
	    {"exact-month-start", periodStart(1, core::Frequency::MonthStart)},
	    {"exact-year-start", periodStart(12, core::Frequency::YearStart)},
	    {"median-gap", medianGap},
	};
}

core::Frequency FrequencyInference::classifyMedianGap(Duration median_gap) {
	// Whole days, rounded down.
	const auto days = std::chrono::duration_cast<std::chrono::hours>(median_gap).count() / 24;
	if (days <= 1) {
		return core::Frequency::Daily;
	}
	if (days <= 7) {
		return core::Frequency::Weekly;
	}
	if (days <= 31) {
		return core::Frequency::MonthStart;
	}
	return core::Frequency::YearStart;
}

FrequencyDecision FrequencyInference::infer(const std::vector<TimePoint> &timestamps) const {
	if (timestamps.size() < 2) {
		throw std::invalid_argument("Frequency inference needs at least two timestamps.");
	}
	for (const auto &rule : rules_) {
		if (const auto frequency = rule.match(timestamps)) {
			return FrequencyDecision{*frequency, rule.name};
		}
	}
	throw std::invalid_argument("No frequency rule matched the timestamps.");
}

} // namespace tsforecast::pipeline
