#pragma once

#include "tsforecast/core/forecast.hpp"
#include "tsforecast/core/time_series.hpp"

#include <string>

namespace tsforecast::models {

/**
 * @class IForecaster
 * @brief The capability the pipeline needs from a fitted model.
 *
 * A forecaster is bound to the series it was fitted on. Predictions never
 * mutate the model, so repeated calls with the same horizon return the same
 * values and a fitted model can be shared between threads.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Point forecasts for the next @p horizon steps.
	 * @throws std::invalid_argument If horizon < 1.
	 */
	virtual core::Forecast predict(int horizon) const = 0;

	/**
	 * @brief Point forecasts plus a two-sided interval at the given level.
	 * @param confidence Coverage of the interval, within (0, 1).
	 */
	virtual core::Forecast predictWithConfidence(int horizon, double confidence) const = 0;

	virtual bool isFitted() const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 */
	virtual std::string getName() const = 0;
};

} // namespace tsforecast::models
