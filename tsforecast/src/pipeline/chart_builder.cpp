#include "tsforecast/pipeline/chart_builder.hpp"

#include "tsforecast/utils/logging.hpp"

#include <exception>
#include <utility>

namespace tsforecast::pipeline {

ChartBuilder::ChartBuilder(std::shared_ptr<const chart::IChartRenderer> renderer)
    : ChartBuilder(std::move(renderer), Labels{}) {
}

ChartBuilder::ChartBuilder(std::shared_ptr<const chart::IChartRenderer> renderer, Labels labels)
    : renderer_(std::move(renderer)), labels_(std::move(labels)) {
}

chart::ChartPayload ChartBuilder::build(const core::TimeSeries &series, const ForecastResult &forecast, bool render,
                                        const std::string &title) const {
	chart::ChartPayload payload;
	payload.title = title;

	payload.historical.label = labels_.historical;
	payload.historical.dates = series.getTimestamps();
	payload.historical.values = series.getValues();

	payload.forecast.label = labels_.forecast;
	payload.forecast.dates = forecast.dates;
	payload.forecast.values = forecast.values;

	payload.interval.label = labels_.interval;
	payload.interval.dates = forecast.dates;
	payload.interval.lower = forecast.lower_ci;
	payload.interval.upper = forecast.upper_ci;

	if (!render) {
		return payload;
	}
	if (!renderer_) {
		TSFORECAST_WARN("Chart requested but no renderer is configured");
		return payload;
	}

	try {
		payload.image = renderer_->render(payload);
		TSFORECAST_DEBUG("Rendered chart '{}' ({} bytes)", title, payload.image->size());
	} catch (const std::exception &e) {
		TSFORECAST_WARN("Chart rendering failed, continuing without image: {}", e.what());
		payload.image.reset();
	}
	return payload;
}

} // namespace tsforecast::pipeline
