#pragma once

#include "tsforecast/core/forecast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast::utils {

/// Accuracy of a forecast against held-out actuals.
struct HoldoutScore {
	std::size_t points = 0;
	double mae = 0.0;
	double rmse = 0.0;
	/// Mean absolute percentage error over the non-zero actuals; absent when all are zero.
	std::optional<double> mape;
	/// Share of actuals inside the interval; absent for a forecast without intervals.
	std::optional<double> coverage;

	/// One-line human readable form, e.g. "RMSE 21.30, MAE 17.85, MAPE 3.92%, coverage 95.8% over 29 points".
	std::string summary() const;
};

/**
 * @brief Scores forecasts the trainer produces on its holdout slice.
 */
class HoldoutEvaluator final {
public:
	/**
	 * @throws std::invalid_argument If @p actual is empty, lengths differ, or a
	 *         value or interval bound is not finite.
	 */
	static HoldoutScore score(const std::vector<double> &actual, const core::Forecast &forecast);
};

} // namespace tsforecast::utils
