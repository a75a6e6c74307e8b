#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tsforecast::core {

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * Contains the point predictions and, when requested, the lower and upper
 * bounds of the prediction interval at each step.
 */
struct Forecast {
	using Series = std::vector<double>;

	/// Point forecasts, one per step.
	Series point;

	std::optional<Series> lower;
	std::optional<Series> upper;

	/// Returns whether the forecast contains any values.
	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}

	bool hasIntervals() const {
		return lower.has_value() && upper.has_value();
	}

	const Series &lowerSeries() const {
		if (!lower.has_value()) {
			throw std::out_of_range("Lower interval not available.");
		}
		return *lower;
	}

	const Series &upperSeries() const {
		if (!upper.has_value()) {
			throw std::out_of_range("Upper interval not available.");
		}
		return *upper;
	}
};

} // namespace tsforecast::core
