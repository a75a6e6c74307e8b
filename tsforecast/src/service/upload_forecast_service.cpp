#include "tsforecast/service/upload_forecast_service.hpp"

#include "tsforecast/chart/gnuplot_renderer.hpp"
#include "tsforecast/core/calendar.hpp"
#include "tsforecast/core/errors.hpp"
#include "tsforecast/io/csv_reader.hpp"
#include "tsforecast/pipeline/chart_builder.hpp"
#include "tsforecast/pipeline/forecaster.hpp"
#include "tsforecast/pipeline/schema_inferencer.hpp"
#include "tsforecast/pipeline/series_regularizer.hpp"
#include "tsforecast/utils/base64.hpp"
#include "tsforecast/utils/logging.hpp"

#include <cmath>
#include <exception>
#include <mutex>
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

class UploadForecastService::State {
public:
	State(ServiceConfig config, std::shared_ptr<const chart::IChartRenderer> renderer, models::ModelSelector selector);

	UploadResponse upload(const core::RawTable &table);
	ForecastResponse forecast(int steps, bool plot);
	UploadStatusResponse status() const;
	std::shared_ptr<const Slot> snapshot() const;
	void clear();

private:
	std::shared_ptr<const models::SARIMA> fittedModel(const std::shared_ptr<const Slot> &slot);
	ModelInfo modelInfo(const Slot &slot, const models::SARIMA &model) const;
	DataInfo describe(const core::TimeSeries &series, const pipeline::SchemaChoice &choice) const;

	ServiceConfig config_;
	pipeline::SchemaInferencer inferencer_;
	pipeline::SeriesRegularizer regularizer_;
	models::ModelSelector selector_;
	pipeline::Forecaster forecaster_;
	pipeline::ChartBuilder chart_builder_;

	mutable std::mutex mutex_;
	std::shared_ptr<const Slot> slot_;
};

UploadForecastService::State::State(ServiceConfig config, std::shared_ptr<const chart::IChartRenderer> renderer,
                                    models::ModelSelector selector)
    : config_(std::move(config)), selector_(std::move(selector)), forecaster_(config_.confidence_level),
      chart_builder_(resolveRenderer(config_, std::move(renderer))) {
}

DataInfo UploadForecastService::State::describe(const core::TimeSeries &series,
                                                const pipeline::SchemaChoice &choice) const {
	const auto &values = series.getValues();
	double sum = 0.0;
	for (double v : values) {
		sum += v;
	}
	const double mean = sum / static_cast<double>(values.size());
	double squares = 0.0;
	for (double v : values) {
		squares += (v - mean) * (v - mean);
	}

	DataInfo info;
	info.data_points = series.size();
	info.date_range = core::calendar::formatTimestamp(series.firstTimestamp(), "%Y-%m-%d") + " to " +
	                  core::calendar::formatTimestamp(series.lastTimestamp(), "%Y-%m-%d");
	info.date_column = choice.time_column;
	info.value_column = choice.value_column;
	info.mean_value = mean;
	info.std_value = values.size() > 1 ? std::sqrt(squares / static_cast<double>(values.size() - 1)) : 0.0;
	return info;
}

UploadResponse UploadForecastService::State::upload(const core::RawTable &table) {
	try {
		const pipeline::SchemaChoice choice = inferencer_.infer(table);
		core::TimeSeries series = regularizer_.regularize(table, choice.time_column, choice.value_column);
		DataInfo info = describe(series, choice);

		std::shared_ptr<const Slot> slot = std::make_shared<Slot>(Slot{std::move(series), info, nullptr});
		{
			std::lock_guard<std::mutex> lock(mutex_);
			slot_ = std::move(slot);
		}

		UploadResponse response;
		response.success = true;
		response.data_info = info;
		response.message = "Data loaded successfully: " + std::to_string(info.data_points) + " points";
		TSFORECAST_INFO("Uploaded series '{}' with {} points ({})", info.value_column, info.data_points,
		                info.date_range);
		return response;
	} catch (const std::exception &e) {
		TSFORECAST_WARN("Upload rejected: {}", e.what());
		return UploadResponse::failure(e.what());
	}
}

UploadForecastService::UploadForecastService(ServiceConfig config,
                                             std::shared_ptr<const chart::IChartRenderer> renderer,
                                             models::ModelSelector selector)
    : state_(std::make_shared<State>(std::move(config), std::move(renderer), std::move(selector))) {
}

UploadResponse UploadForecastService::upload(const core::RawTable &table) {
	return state_->upload(table);
}

UploadResponse UploadForecastService::uploadCsv(const std::string &content) {
	try {
		return upload(io::CsvReader().parse(content));
	} catch (const std::exception &e) {
		TSFORECAST_WARN("Upload rejected: {}", e.what());
		return UploadResponse::failure(e.what());
	}
}

std::shared_ptr<const UploadForecastService::Slot> UploadForecastService::State::snapshot() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return slot_;
}


void UploadForecastService::State::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	slot_.reset();
}

std::shared_ptr<const models::SARIMA>
UploadForecastService::State::fittedModel(const std::shared_ptr<const Slot> &slot) {
	if (slot->model) {
		return slot->model;
	}

	std::shared_ptr<const models::SARIMA> model = selector_.fit(slot->series);

	std::lock_guard<std::mutex> lock(mutex_);
	if (slot_ == slot) {
		slot_ = std::make_shared<Slot>(Slot{slot->series, slot->info, model});
	} else {
		TSFORECAST_DEBUG("Series replaced during fit; fitted model not published");
	}
	return model;
}

ModelInfo UploadForecastService::State::modelInfo(const Slot &slot, const models::SARIMA &model) const {
	ModelInfo info;
	info.model_type = config_.model_label;
	info.order = model.spec().orderString();
	if (model.spec().isSeasonal()) {
		info.seasonal_order = model.spec().seasonalOrderString();
	}
	info.data_points = slot.series.size();
	info.frequency = core::frequencyCode(*slot.series.frequency());
	info.last_date = core::calendar::formatTimestamp(slot.series.lastTimestamp(), config_.date_format);
	info.value_column = slot.info.value_column;
	return info;
}

ForecastResponse UploadForecastService::State::forecast(int steps, bool plot) {
	try {
		const auto slot = snapshot();
		if (!slot) {
			throw core::NotLoadedError("No data loaded. Upload a CSV file first.");
		}
		const auto model = fittedModel(slot);
		const pipeline::ForecastResult result = forecaster_.forecast(*model, slot->series, steps);

		ForecastResponse response = ForecastResponse::fromResult(result, config_.date_format);
		response.model_info = modelInfo(*slot, *model);
		if (plot) {
			const auto payload = chart_builder_.build(slot->series, result, true, config_.chart_title);
			if (payload.image) {
				response.plot = utils::base64Encode(*payload.image);
			}
		}
		return response;
	} catch (const std::exception &e) {
		TSFORECAST_WARN("Forecast of uploaded data ({} steps) failed: {}", steps, e.what());
		return ForecastResponse::failure(e.what());
	}
}


UploadStatusResponse UploadForecastService::State::status() const {
	const auto slot = snapshot();
	UploadStatusResponse response;
	response.success = true;
	response.has_custom_data = slot != nullptr;
	if (slot) {
		response.data_info = slot->info;
	}
	return response;
}

ForecastResponse UploadForecastService::forecast(int steps, bool plot) {
	return state_->forecast(steps, plot);
}

std::future<ForecastResponse> UploadForecastService::forecastAsync(int steps, bool plot) {
	std::shared_ptr<State> state = state_;
	return std::async(std::launch::async, [state, steps, plot]() { return state->forecast(steps, plot); });
}

UploadStatusResponse UploadForecastService::status() const {
	return state_->status();
}

bool UploadForecastService::hasData() const {
	return state_->snapshot() != nullptr;
}

void UploadForecastService::clear() {
	state_->clear();
}

} // namespace tsforecast::service
