#pragma once

#include "tsforecast/core/frequency.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast::pipeline {

/**
 * @brief One entry of the frequency rule list.
 *
 * A rule inspects sorted, unique timestamps and either claims a frequency or
 * declines with std::nullopt.
 */
struct FrequencyRule {
	using TimePoint = std::chrono::system_clock::time_point;
	using Matcher = std::function<std::optional<core::Frequency>(const std::vector<TimePoint> &)>;

	std::string name;
	Matcher match;
};

struct FrequencyDecision {
	core::Frequency frequency;
	/// Name of the rule that produced the decision.
	std::string rule;
};

/**
 * @class FrequencyInference
 * @brief Applies an ordered rule list; the first rule that claims a frequency wins.
 *
 * The default list tries the exact regular spacings first (daily, weekly,
 * month start, year start) and ends with the median-gap heuristic, which
 * always decides. Inference therefore never fails on two or more timestamps.
 */
class FrequencyInference {
public:
	using TimePoint = FrequencyRule::TimePoint;

	FrequencyInference();
	explicit FrequencyInference(std::vector<FrequencyRule> rules);

	/**
	 * @param timestamps Strictly increasing timestamps.
	 * @throws std::invalid_argument For fewer than two timestamps or when no rule matches.
	 */
	FrequencyDecision infer(const std::vector<TimePoint> &timestamps) const;

	const std::vector<FrequencyRule> &rules() const {
		return rules_;
	}

	static std::vector<FrequencyRule> defaultRules();

	/// Classifies a median gap: <= 1 day daily, <= 7 weekly, <= 31 month start, otherwise year start.
	static core::Frequency classifyMedianGap(std::chrono::system_clock::duration median_gap);

private:
	std::vector<FrequencyRule> rules_;
};

} // namespace tsforecast::pipeline
