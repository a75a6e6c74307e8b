#pragma once

#include "tsforecast/chart/chart_renderer.hpp"
#include "tsforecast/core/raw_table.hpp"
#include "tsforecast/core/time_series.hpp"
#include "tsforecast/models/model_selector.hpp"
#include "tsforecast/service/responses.hpp"
#include "tsforecast/service/service_config.hpp"

#include <future>
#include <memory>
#include <string>

namespace tsforecast::service {

/**
 * @class UploadForecastService
 * @brief Forecasts a series uploaded by the user.
 *
 * The service holds at most one series and the model fitted on it. Both sit
 * in an immutable slot behind a mutex: readers take a snapshot of the slot
 * pointer and work on it without holding the lock, and an upload replaces the
 * slot wholesale. The model is fitted on the first forecast after an upload,
 * outside the lock, and is only published when the slot still holds the series
 * it was fitted on.
 *
 * All of this lives in a state object shared with pending forecastAsync()
 * tasks, so their futures stay valid after the service is destroyed.
 */
class UploadForecastService {
public:
	explicit UploadForecastService(ServiceConfig config = uploadServiceConfig(),
	                               std::shared_ptr<const chart::IChartRenderer> renderer = nullptr,
	                               models::ModelSelector selector = models::ModelSelector());

	UploadForecastService(const UploadForecastService &) = delete;
	UploadForecastService &operator=(const UploadForecastService &) = delete;

	/// Infers the schema, regularizes and stores the series. Never throws.
	UploadResponse upload(const core::RawTable &table);

	/// Decodes CSV text and uploads it. Never throws.
	UploadResponse uploadCsv(const std::string &content);

	/// Fits the current series if needed and forecasts it. Never throws.
	ForecastResponse forecast(int steps, bool plot = false);

	/// Runs forecast() on its own thread. The task keeps the service state alive.
	std::future<ForecastResponse> forecastAsync(int steps, bool plot = false);

	UploadStatusResponse status() const;

	bool hasData() const;

	/// Discards the current series and model.
	void clear();

private:
	struct Slot {
		core::TimeSeries series;
		DataInfo info;
		std::shared_ptr<const models::SARIMA> model;
	};

	class State;

	std::shared_ptr<State> state_;
};

} // namespace tsforecast::service
