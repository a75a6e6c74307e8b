#pragma once

#include "tsforecast/chart/chart_renderer.hpp"
#include "tsforecast/io/model_store.hpp"
#include "tsforecast/pipeline/chart_builder.hpp"
#include "tsforecast/pipeline/forecaster.hpp"
#include "tsforecast/service/responses.hpp"
#include "tsforecast/service/service_config.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tsforecast::service {

/**
 * @class BundledForecastService
 * @brief Serves forecasts from the model trained offline and stored on disk.
 *
 * The artifacts are loaded once on construction. When loading fails the
 * service stays usable in a degraded state: status() reports the model as not
 * loaded and every forecast fails with an error response. The service is
 * immutable after construction, so concurrent forecasts are safe.
 */
class BundledForecastService {
public:
	explicit BundledForecastService(const std::string &model_directory, ServiceConfig config = bundledServiceConfig(),
	                                std::shared_ptr<const chart::IChartRenderer> renderer = nullptr);

	bool isLoaded() const {
		return model_ != nullptr;
	}

	/// Reason the artifacts could not be loaded; empty when loaded.
	const std::string &loadError() const {
		return load_error_;
	}

	StatusResponse status() const;

	/// Never throws; failures become error responses.
	ForecastResponse forecast(int steps, bool plot = false) const;

private:
	ModelInfo modelInfo() const;

	ServiceConfig config_;
	std::unique_ptr<const models::SARIMA> model_;
	std::optional<core::TimeSeries> series_;
	std::string load_error_;
	pipeline::Forecaster forecaster_;
	pipeline::ChartBuilder chart_builder_;
};

} // namespace tsforecast::service
