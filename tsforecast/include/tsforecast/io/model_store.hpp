#pragma once

#include "tsforecast/core/time_series.hpp"
#include "tsforecast/models/sarima.hpp"

#include <json/json.h>
#include <memory>
#include <string>

namespace tsforecast::io {

/// A fitted model together with the series it is bound to.
struct StoredModel {
	std::unique_ptr<models::SARIMA> model;
	core::TimeSeries series;
};

/**
 * @class ModelStore
 * @brief Reads and writes the bundled model artifacts of one directory.
 *
 * The directory holds model.json (orders and coefficients) and series.json
 * (the regularized series). Loading rebuilds the model from its coefficients
 * and the series; nothing is re-estimated.
 */
class ModelStore {
public:
	static constexpr int kFormatVersion = 1;
	static constexpr const char *kModelFile = "model.json";
	static constexpr const char *kSeriesFile = "series.json";

	explicit ModelStore(std::string directory);

	/**
	 * @brief Writes both artifacts, creating the directory when needed.
	 * @throws std::invalid_argument If the model is not fitted or the series has no frequency.
	 * @throws std::runtime_error If a file cannot be written.
	 */
	void save(const models::SARIMA &model, const core::TimeSeries &series) const;

	/**
	 * @throws std::runtime_error Naming the offending file for any read, parse or consistency failure.
	 */
	StoredModel load() const;

	/// True when both artifact files exist.
	bool exists() const;

	const std::string &directory() const {
		return directory_;
	}

	std::string modelPath() const;
	std::string seriesPath() const;

	static Json::Value modelToJson(const models::SARIMA &model);
	static Json::Value seriesToJson(const core::TimeSeries &series);

private:
	std::string directory_;
};

} // namespace tsforecast::io
