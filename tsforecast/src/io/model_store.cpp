#include "tsforecast/io/model_store.hpp"

#include "tsforecast/core/calendar.hpp"
#include "tsforecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tsforecast::io {

namespace {

namespace fs = std::filesystem;

Json::Value toJsonArray(const std::vector<double> &values) {
	Json::Value array(Json::arrayValue);
	for (double v : values) {
		array.append(v);
	}
	return array;
}

Json::Value orderArray(std::initializer_list<int> orders) {
	Json::Value array(Json::arrayValue);
	for (int order : orders) {
		array.append(order);
	}
	return array;
}

void writeJson(const std::string &path, const Json::Value &root) {
	std::ofstream out(path, std::ios::binary);
	if (!out) {
		throw std::runtime_error("Cannot open '" + path + "' for writing.");
	}
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "  ";
	std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	writer->write(root, &out);
	out << '\n';
	if (!out.good()) {
		throw std::runtime_error("Failed to write '" + path + "'.");
	}
}

Json::Value readJson(const std::string &path) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw std::runtime_error("Cannot open '" + path + "' for reading.");
	}
	Json::CharReaderBuilder builder;
	builder["collectComments"] = false;
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(builder, in, &root, &errors)) {
		throw std::runtime_error("Invalid JSON in '" + path + "': " + errors);
	}
	if (!root.isObject()) {
		throw std::runtime_error("Expected a JSON object in '" + path + "'.");
	}
	return root;
}

std::vector<double> readNumbers(const Json::Value &value, const std::string &field) {
	if (!value.isArray()) {
		throw std::runtime_error("Field '" + field + "' must be an array of numbers.");
	}
	std::vector<double> out;
	out.reserve(value.size());
	for (const auto &item : value) {
		if (!item.isNumeric()) {
			throw std::runtime_error("Field '" + field + "' must be an array of numbers.");
		}
		out.push_back(item.asDouble());
	}
	return out;
}

std::vector<int> readOrders(const Json::Value &value, const std::string &field, Json::ArrayIndex expected) {
	if (!value.isArray() || value.size() != expected) {
		throw std::runtime_error("Field '" + field + "' must hold " + std::to_string(expected) + " integers.");
	}
	std::vector<int> out;
	for (const auto &item : value) {
		if (!item.isInt()) {
			throw std::runtime_error("Field '" + field + "' must hold " + std::to_string(expected) + " integers.");
		}
		out.push_back(item.asInt());
	}
	return out;
}

models::ModelSpec readSpec(const Json::Value &root) {
	if (root.get("format_version", Json::Value()).asInt() != ModelStore::kFormatVersion) {
		throw std::runtime_error("Unsupported format_version.");
	}
	if (root.get("model", Json::Value()).asString() != "SARIMA") {
		throw std::runtime_error("Unsupported model type '" + root.get("model", Json::Value()).asString() + "'.");
	}

	const auto order = readOrders(root["order"], "order", 3);
	models::ModelSpec spec;
	spec.p = order[0];
	spec.d = order[1];
	spec.q = order[2];

	const Json::Value &seasonal = root["seasonal_order"];
	if (!seasonal.isNull()) {
		const auto seasonal_order = readOrders(seasonal, "seasonal_order", 4);
		spec.P = seasonal_order[0];
		spec.D = seasonal_order[1];
		spec.Q = seasonal_order[2];
		spec.period = seasonal_order[3];
	}
	return spec;
}

models::SARIMAParameters readParameters(const Json::Value &root) {
	const Json::Value &params = root["parameters"];
	if (!params.isObject()) {
		throw std::runtime_error("Missing 'parameters' object.");
	}
	models::SARIMAParameters out;
	out.ar = readNumbers(params["ar"], "parameters.ar");
	out.ma = readNumbers(params["ma"], "parameters.ma");
	out.seasonal_ar = readNumbers(params["seasonal_ar"], "parameters.seasonal_ar");
	out.seasonal_ma = readNumbers(params["seasonal_ma"], "parameters.seasonal_ma");
	return out;
}

core::TimeSeries readSeries(const Json::Value &root) {
	const auto frequency = core::frequencyFromCode(root.get("frequency", Json::Value()).asString());
	if (!frequency) {
		throw std::runtime_error("Unknown frequency '" + root.get("frequency", Json::Value()).asString() + "'.");
	}

	const Json::Value &stamps = root["timestamps"];
	if (!stamps.isArray()) {
		throw std::runtime_error("Field 'timestamps' must be an array of strings.");
	}
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(stamps.size());
	for (Json::ArrayIndex i = 0; i < stamps.size(); ++i) {
		std::optional<core::TimeSeries::TimePoint> parsed;
		if (stamps[i].isString()) {
			parsed = core::calendar::parseTimestamp(stamps[i].asString());
		}
		if (!parsed) {
			throw std::runtime_error("Invalid timestamp at index " + std::to_string(i) + ".");
		}
		timestamps.push_back(*parsed);
	}

	auto values = readNumbers(root["values"], "values");
	core::TimeSeries series(std::move(timestamps), std::move(values), root.get("value_column", "").asString(),
	                        *frequency);
	if (series.hasMissingValues()) {
		throw std::runtime_error("Series values must be finite.");
	}
	return series;
}

} // namespace

ModelStore::ModelStore(std::string directory) : directory_(std::move(directory)) {
}

std::string ModelStore::modelPath() const {
	return (fs::path(directory_) / kModelFile).string();
}

std::string ModelStore::seriesPath() const {
	return (fs::path(directory_) / kSeriesFile).string();
}

bool ModelStore::exists() const {
	std::error_code ec;
	return fs::exists(modelPath(), ec) && fs::exists(seriesPath(), ec);
}

Json::Value ModelStore::modelToJson(const models::SARIMA &model) {
	const auto &spec = model.spec();
	const auto params = model.parameters();

	Json::Value root(Json::objectValue);
	root["format_version"] = kFormatVersion;
	root["model"] = model.getName();
	root["order"] = orderArray({spec.p, spec.d, spec.q});
	root["seasonal_order"] = spec.isSeasonal() ? orderArray({spec.P, spec.D, spec.Q, spec.period}) : Json::Value();

	Json::Value parameters(Json::objectValue);
	parameters["ar"] = toJsonArray(params.ar);
	parameters["ma"] = toJsonArray(params.ma);
	parameters["seasonal_ar"] = toJsonArray(params.seasonal_ar);
	parameters["seasonal_ma"] = toJsonArray(params.seasonal_ma);
	root["parameters"] = parameters;

	root["sigma2"] = model.sigma2();
	root["log_likelihood"] = model.logLikelihood();
	return root;
}

Json::Value ModelStore::seriesToJson(const core::TimeSeries &series) {
	if (!series.frequency()) {
		throw std::invalid_argument("Only regularized series with a frequency can be stored.");
	}
	Json::Value root(Json::objectValue);
	root["value_column"] = series.label();
	root["frequency"] = core::frequencyCode(*series.frequency());

	Json::Value stamps(Json::arrayValue);
	for (const auto &tp : series.getTimestamps()) {
		stamps.append(core::calendar::toIsoString(tp));
	}
	root["timestamps"] = stamps;
	root["values"] = toJsonArray(series.getValues());
	return root;
}

void ModelStore::save(const models::SARIMA &model, const core::TimeSeries &series) const {
	if (!model.isFitted()) {
		throw std::invalid_argument("Cannot store a model that has not been fitted.");
	}
	const Json::Value series_json = seriesToJson(series);

	std::error_code ec;
	fs::create_directories(directory_, ec);
	if (ec) {
		throw std::runtime_error("Cannot create directory '" + directory_ + "': " + ec.message());
	}

	writeJson(modelPath(), modelToJson(model));
	writeJson(seriesPath(), series_json);
	TSFORECAST_INFO("Stored SARIMA{}{} and {} observations in '{}'", model.spec().orderString(),
	                model.spec().isSeasonal() ? "x" + model.spec().seasonalOrderString() : std::string{},
	                series.size(), directory_);
}

StoredModel ModelStore::load() const {
	const std::string model_path = modelPath();
	const std::string series_path = seriesPath();

	const Json::Value model_json = readJson(model_path);
	const Json::Value series_json = readJson(series_path);

	models::ModelSpec spec;
	models::SARIMAParameters parameters;
	try {
		spec = readSpec(model_json);
		parameters = readParameters(model_json);
	} catch (const std::exception &e) {
		throw std::runtime_error("Invalid model file '" + model_path + "': " + e.what());
	}

	std::unique_ptr<core::TimeSeries> series;
	try {
		series = std::make_unique<core::TimeSeries>(readSeries(series_json));
	} catch (const std::exception &e) {
		throw std::runtime_error("Invalid series file '" + series_path + "': " + e.what());
	}

	std::unique_ptr<models::SARIMA> model;
	try {
		model = models::SARIMABuilder().withSpec(spec).build();
		model->restore(*series, parameters);
	} catch (const std::exception &e) {
		throw std::runtime_error("Model in '" + model_path + "' does not fit the stored series: " + e.what());
	}

	const Json::Value &stored_sigma2 = model_json["sigma2"];
	if (stored_sigma2.isNumeric()) {
		const double expected = stored_sigma2.asDouble();
		if (std::abs(expected - model->sigma2()) > 1e-6 * std::max(1.0, std::abs(expected))) {
			TSFORECAST_WARN("Recomputed sigma2 {} differs from stored value {} in '{}'", model->sigma2(), expected,
			                model_path);
		}
	}

	TSFORECAST_INFO("Loaded SARIMA{} with {} observations from '{}'", spec.orderString(), series->size(),
	                directory_);
	return StoredModel{std::move(model), std::move(*series)};
}

} // namespace tsforecast::io
