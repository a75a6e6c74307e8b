#include "tsforecast/service/bundled_forecast_service.hpp"

#include "tsforecast/chart/gnuplot_renderer.hpp"
#include "tsforecast/core/calendar.hpp"
#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/base64.hpp"
#include "tsforecast/utils/logging.hpp"

#include <exception>
#include <utility>

namespace tsforecast::service {

namespace {

std::shared_ptr<const chart::IChartRenderer> resolveRenderer(const ServiceConfig &config,
                                                             std::shared_ptr<const chart::IChartRenderer> renderer) {
	if (renderer || !config.render_chart) {
		return renderer;
	}
	return std::make_shared<chart::GnuplotRenderer>(config.renderer);
}

} // namespace

BundledForecastService::BundledForecastService(const std::string &model_directory, ServiceConfig config,
                                               std::shared_ptr<const chart::IChartRenderer> renderer)
    : config_(std::move(config)), forecaster_(config_.confidence_level),
      chart_builder_(resolveRenderer(config_, std::move(renderer))) {
	try {
		io::StoredModel stored = io::ModelStore(model_directory).load();
		series_.emplace(std::move(stored.series));
		model_ = std::move(stored.model);
		TSFORECAST_INFO("Bundled model loaded from '{}'", model_directory);
	} catch (const std::exception &e) {
		load_error_ = e.what();
		model_.reset();
		series_.reset();
		TSFORECAST_ERROR("Bundled model not loaded, forecasts will fail: {}", load_error_);
	}
}

ModelInfo BundledForecastService::modelInfo() const {
	ModelInfo info;
	info.model_type = config_.model_label;
	info.order = model_->spec().orderString();
	if (model_->spec().isSeasonal()) {
		info.seasonal_order = model_->spec().seasonalOrderString();
	}
	info.data_points = series_->size();
	info.last_date = core::calendar::formatTimestamp(series_->lastTimestamp(), config_.date_format);
	return info;
}

StatusResponse BundledForecastService::status() const {
	StatusResponse response;
	response.success = true;
	response.model_loaded = isLoaded();
	if (isLoaded()) {
		response.model_info = modelInfo();
	} else {
		response.error = "model not loaded";
	}
	return response;
}

ForecastResponse BundledForecastService::forecast(int steps, bool plot) const {
	try {
		if (!isLoaded()) {
			throw core::NotLoadedError("model not loaded: " + load_error_);
		}
		const pipeline::ForecastResult result = forecaster_.forecast(*model_, *series_, steps);
		ForecastResponse response = ForecastResponse::fromResult(result, config_.date_format);
		response.model_info = modelInfo();

		if (plot) {
			const auto payload = chart_builder_.build(*series_, result, true, config_.chart_title);
			if (payload.image) {
				response.plot = utils::base64Encode(*payload.image);
			}
		}
		return response;
	} catch (const std::exception &e) {
		TSFORECAST_WARN("Bundled forecast of {} steps failed: {}", steps, e.what());
		return ForecastResponse::failure(e.what());
	}
}

} // namespace tsforecast::service
