#pragma once

#include "tsforecast/core/calendar.hpp"

#include <optional>
#include <string>

namespace tsforecast::core {

/**
 * @brief Calendar spacing of a regularized series.
 */
enum class Frequency {
	Daily,
	Weekly,
	MonthStart,
	YearStart
};

/// Short code of a frequency: "D", "W", "MS" or "YS".
std::string frequencyCode(Frequency frequency);

/// Inverse of frequencyCode(); std::nullopt for unknown codes.
std::optional<Frequency> frequencyFromCode(const std::string &code);

/**
 * @brief Moves @p tp forward by @p steps periods of @p frequency.
 *
 * Daily and weekly steps are fixed durations. Monthly and yearly steps are
 * calendar steps that keep the time of day and clamp the day of month.
 * @throws std::invalid_argument If the result leaves the range of TimePoint.
 */
calendar::TimePoint advance(const calendar::TimePoint &tp, Frequency frequency, int steps = 1);

} // namespace tsforecast::core
