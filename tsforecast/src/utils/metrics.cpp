#include "tsforecast/utils/metrics.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tsforecast::utils {

std::string HoldoutScore::summary() const {
	std::ostringstream out;
	out.setf(std::ios::fixed);
	out.precision(2);
	out << "RMSE " << rmse << ", MAE " << mae;
	if (mape) {
		out << ", MAPE " << *mape << '%';
	}
	if (coverage) {
		out.precision(1);
		out << ", coverage " << *coverage * 100.0 << '%';
	}
	out << " over " << points << " points";
	return out.str();
}

HoldoutScore HoldoutEvaluator::score(const std::vector<double> &actual, const core::Forecast &forecast) {
	const std::size_t n = actual.size();
	if (n == 0 || forecast.horizon() != n) {
		throw std::invalid_argument("Holdout of " + std::to_string(n) + " points cannot score a forecast of " +
		                            std::to_string(forecast.horizon()) + " steps.");
	}
	const bool with_interval = forecast.hasIntervals();
	if (with_interval && (forecast.lower->size() != n || forecast.upper->size() != n)) {
		throw std::invalid_argument("Forecast interval does not match the forecast horizon.");
	}

	double abs_sum = 0.0;
	double sq_sum = 0.0;
	double pct_sum = 0.0;
	std::size_t pct_count = 0;
	std::size_t inside = 0;
	for (std::size_t i = 0; i < n; ++i) {
		const double error = actual[i] - forecast.point[i];
		if (!std::isfinite(error)) {
			throw std::invalid_argument("Holdout values and forecasts must be finite.");
		}
		abs_sum += std::abs(error);
		sq_sum += error * error;
		if (std::abs(actual[i]) > std::numeric_limits<double>::epsilon()) {
			pct_sum += std::abs(error / actual[i]);
			++pct_count;
		}
		if (with_interval) {
			const double lo = (*forecast.lower)[i];
			const double hi = (*forecast.upper)[i];
			if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi) {
				throw std::invalid_argument("Interval bounds must be finite and ordered.");
			}
			if (actual[i] >= lo && actual[i] <= hi) {
				++inside;
			}
		}
	}

	HoldoutScore score;
	score.points = n;
	score.mae = abs_sum / static_cast<double>(n);
	score.rmse = std::sqrt(sq_sum / static_cast<double>(n));
	if (pct_count > 0) {
		score.mape = 100.0 * pct_sum / static_cast<double>(pct_count);
	}
	if (with_interval) {
		score.coverage = static_cast<double>(inside) / static_cast<double>(n);
	}
	return score;
}

} // namespace tsforecast::utils
