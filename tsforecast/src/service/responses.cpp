#include "tsforecast/service/responses.hpp"

#include "tsforecast/core/calendar.hpp"

namespace tsforecast::service {

namespace {

template <typename T>
Json::Value toArray(const std::vector<T> &items) {
	Json::Value array(Json::arrayValue);
	for (const auto &item : items) {
		array.append(item);
	}
	return array;
}

std::vector<std::string> formatDates(const std::vector<pipeline::ForecastResult::TimePoint> &dates,
                                     const std::string &format) {
	std::vector<std::string> out;
	out.reserve(dates.size());
	for (const auto &tp : dates) {
		out.push_back(core::calendar::formatTimestamp(tp, format));
	}
	return out;
}

} // namespace

Json::Value HistoricalData::toJson() const {
	Json::Value root(Json::objectValue);
	root["dates"] = toArray(dates);
	root["values"] = toArray(values);
	return root;
}

Json::Value Predictions::toJson() const {
	Json::Value root(Json::objectValue);
	root["dates"] = toArray(dates);
	root["values"] = toArray(values);
	root["lower_ci"] = toArray(lower_ci);
	root["upper_ci"] = toArray(upper_ci);
	return root;
}

Json::Value ModelInfo::toJson() const {
	Json::Value root(Json::objectValue);
	root["model_type"] = model_type;
	root["order"] = order;
	root["seasonal_order"] = seasonal_order ? Json::Value(*seasonal_order) : Json::Value();
	root["data_points"] = static_cast<Json::UInt64>(data_points);
	root["last_date"] = last_date;
	if (frequency) {
		root["frequency"] = *frequency;
	}
	if (value_column) {
		root["value_column"] = *value_column;
	}
	return root;
}

Json::Value DataInfo::toJson() const {
	Json::Value root(Json::objectValue);
	root["data_points"] = static_cast<Json::UInt64>(data_points);
	root["date_range"] = date_range;
	root["date_column"] = date_column;
	root["value_column"] = value_column;
	root["mean_value"] = mean_value;
	root["std_value"] = std_value;
	return root;
}

ForecastResponse ForecastResponse::fromResult(const pipeline::ForecastResult &result, const std::string &date_format) {
	ForecastResponse response;
	response.success = true;
	response.steps = static_cast<int>(result.steps());
	response.predictions.dates = formatDates(result.dates, date_format);
	response.predictions.values = result.values;
	response.predictions.lower_ci = result.lower_ci;
	response.predictions.upper_ci = result.upper_ci;
	response.historical_data.dates = formatDates(result.history_dates, date_format);
	response.historical_data.values = result.history_values;
	return response;
}

ForecastResponse ForecastResponse::failure(const std::string &message) {
	ForecastResponse response;
	response.success = false;
	response.error = message;
	return response;
}

Json::Value ForecastResponse::toJson() const {
	Json::Value root(Json::objectValue);
	root["success"] = success;
	if (!success) {
		root["error"] = error;
		return root;
	}
	root["predictions"] = predictions.toJson();
	root["historical_data"] = historical_data.toJson();
	root["model_info"] = model_info.toJson();
	root["steps"] = steps;
	if (plot) {
		root["plot"] = *plot;
	}
	return root;
}

Json::Value StatusResponse::toJson() const {
	Json::Value root(Json::objectValue);
	root["success"] = success;
	root["model_loaded"] = model_loaded;
	if (model_info) {
		root["model_info"] = model_info->toJson();
	} else {
		Json::Value info(Json::objectValue);
		info["error"] = error;
		root["model_info"] = info;
	}
	return root;
}

UploadResponse UploadResponse::failure(const std::string &message) {
	UploadResponse response;
	response.success = false;
	response.error = message;
	return response;
}

Json::Value UploadResponse::toJson() const {
	Json::Value root(Json::objectValue);
	root["success"] = success;
	if (!success) {
		root["error"] = error;
		return root;
	}
	if (data_info) {
		root["data_info"] = data_info->toJson();
	}
	root["message"] = message;
	return root;
}

Json::Value UploadStatusResponse::toJson() const {
	Json::Value root(Json::objectValue);
	root["success"] = success;
	root["has_custom_data"] = has_custom_data;
	root["data_info"] = data_info ? data_info->toJson() : Json::Value();
	return root;
}

std::string toJsonString(const Json::Value &value, int indent) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = indent > 0 ? std::string(static_cast<std::size_t>(indent), ' ') : std::string{};
	return Json::writeString(builder, value);
}

} // namespace tsforecast::service
