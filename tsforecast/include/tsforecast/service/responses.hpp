#pragma once

#include "tsforecast/pipeline/forecaster.hpp"

#include <cstddef>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast::service {

struct HistoricalData {
	std::vector<std::string> dates;
	std::vector<double> values;

	Json::Value toJson() const;
};

struct Predictions {
	std::vector<std::string> dates;
	std::vector<double> values;
	std::vector<double> lower_ci;
	std::vector<double> upper_ci;

	Json::Value toJson() const;
};

/// Description of the model that produced a forecast.
struct ModelInfo {
	std::string model_type;
	std::string order;
	std::optional<std::string> seasonal_order;
	std::size_t data_points = 0;
	std::string last_date;
	/// Only reported for uploaded data.
	std::optional<std::string> frequency;
	std::optional<std::string> value_column;

	Json::Value toJson() const;
};

/// Summary of an uploaded series.
struct DataInfo {
	std::size_t data_points = 0;
	std::string date_range;
	std::string date_column;
	std::string value_column;
	double mean_value = 0.0;
	double std_value = 0.0;

	Json::Value toJson() const;
};

struct ForecastResponse {
	bool success = false;
	std::string error;
	Predictions predictions;
	HistoricalData historical_data;
	ModelInfo model_info;
	int steps = 0;
	/// Base64 PNG when a chart was rendered.
	std::optional<std::string> plot;

	/// Dates formatted with @p date_format, values copied as is.
	static ForecastResponse fromResult(const pipeline::ForecastResult &result, const std::string &date_format);
	static ForecastResponse failure(const std::string &message);

	Json::Value toJson() const;
};

/// Status of the bundled model facade.
struct StatusResponse {
	bool success = true;
	bool model_loaded = false;
	std::optional<ModelInfo> model_info;
	/// Reason reported in model_info when no model is loaded.
	std::string error;

	Json::Value toJson() const;
};

struct UploadResponse {
	bool success = false;
	std::optional<DataInfo> data_info;
	std::string message;
	std::string error;

	static UploadResponse failure(const std::string &message);

	Json::Value toJson() const;
};

struct UploadStatusResponse {
	bool success = true;
	bool has_custom_data = false;
	std::optional<DataInfo> data_info;

	Json::Value toJson() const;
};

/// Serialises a response; indent 0 gives a single line.
std::string toJsonString(const Json::Value &value, int indent = 2);

} // namespace tsforecast::service
