#pragma once

#include "tsforecast/chart/chart_renderer.hpp"
#include "tsforecast/core/time_series.hpp"
#include "tsforecast/pipeline/forecaster.hpp"

#include <memory>
#include <string>

namespace tsforecast::pipeline {

/**
 * @class ChartBuilder
 * @brief Assembles the historical curve, forecast curve and interval band.
 *
 * With a renderer attached the payload can also carry a rasterised image. A
 * rendering failure is logged and leaves the image absent; it never fails the
 * build.
 */
class ChartBuilder {
public:
	struct Labels {
		std::string historical = "Historical data";
		std::string forecast = "Forecast";
		std::string interval = "95% confidence interval";
	};

	explicit ChartBuilder(std::shared_ptr<const chart::IChartRenderer> renderer = nullptr);
	ChartBuilder(std::shared_ptr<const chart::IChartRenderer> renderer, Labels labels);

	chart::ChartPayload build(const core::TimeSeries &series, const ForecastResult &forecast, bool render,
	                          const std::string &title) const;

	bool canRender() const {
		return renderer_ != nullptr;
	}

private:
	std::shared_ptr<const chart::IChartRenderer> renderer_;
	Labels labels_;
};

} // namespace tsforecast::pipeline
