#include "tsforecast/pipeline/forecaster.hpp"

#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/logging.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace tsforecast::pipeline {

Forecaster::Forecaster(double confidence_level) : confidence_level_(confidence_level) {
	if (confidence_level_ <= 0.0 || confidence_level_ >= 1.0) {
		throw std::invalid_argument("Confidence level must be between 0 and 1.");
	}
}

ForecastResult Forecaster::forecast(const models::IForecaster &model, const core::TimeSeries &series,
                                    int steps) const {
	if (steps < 1) {
		throw std::invalid_argument("Forecast steps must be at least 1.");
	}
	const auto frequency = series.frequency();
	if (!frequency) {
		throw std::invalid_argument("Forecasting requires a series with a known frequency.");
	}
	if (!model.isFitted()) {
		throw core::NotLoadedError("Forecast requested before a model was fitted.");
	}

	// Throws std::invalid_argument when the horizon runs past the representable dates.
	std::vector<ForecastResult::TimePoint> dates;
	dates.reserve(static_cast<std::size_t>(steps));
	for (int h = 1; h <= steps; ++h) {
		dates.push_back(core::advance(series.lastTimestamp(), *frequency, h));
	}

	const core::Forecast raw = model.predictWithConfidence(steps, confidence_level_);
	if (raw.horizon() != static_cast<std::size_t>(steps) || !raw.hasIntervals()) {
		throw std::runtime_error(model.getName() + " returned a forecast of unexpected shape.");
	}

	ForecastResult result;
	result.values = raw.point;
	result.lower_ci = raw.lowerSeries();
	result.upper_ci = raw.upperSeries();
	result.dates = std::move(dates);
	result.history_dates = series.getTimestamps();
	result.history_values = series.getValues();

	TSFORECAST_DEBUG("{} forecast of {} steps at {:.0f}% confidence.", model.getName(), steps,
	                 confidence_level_ * 100.0);
	return result;
}

} // namespace tsforecast::pipeline
