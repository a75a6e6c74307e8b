#pragma once

#include "tsforecast/core/time_series.hpp"
#include "tsforecast/models/iforecaster.hpp"

#include <cstddef>
#include <vector>

namespace tsforecast::pipeline {

/**
 * @brief Dated forecast with its interval, plus the history it continues.
 *
 * dates, values, lower_ci and upper_ci are aligned by index and have one
 * entry per requested step.
 */
struct ForecastResult {
	using TimePoint = core::TimeSeries::TimePoint;

	std::vector<TimePoint> dates;
	std::vector<double> values;
	std::vector<double> lower_ci;
	std::vector<double> upper_ci;

	std::vector<TimePoint> history_dates;
	std::vector<double> history_values;

	std::size_t steps() const {
		return dates.size();
	}
};

/**
 * @class Forecaster
 * @brief Rolls a fitted model forward and stamps the steps with calendar dates.
 *
 * Step h is dated h frequency units after the last timestamp of the series,
 * so the dates continue the regularized calendar without gap or overlap.
 */
class Forecaster {
public:
	explicit Forecaster(double confidence_level = 0.95);

	/**
	 * @throws std::invalid_argument If steps < 1, the series carries no frequency
	 *         or the last step would fall outside the supported date range.
	 * @throws core::NotLoadedError If the model has not been fitted.
	 */
	ForecastResult forecast(const models::IForecaster &model, const core::TimeSeries &series, int steps) const;

	double confidenceLevel() const {
		return confidence_level_;
	}

private:
	double confidence_level_;
};

} // namespace tsforecast::pipeline
