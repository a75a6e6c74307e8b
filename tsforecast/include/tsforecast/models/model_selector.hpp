#pragma once

#include "tsforecast/core/time_series.hpp"
#include "tsforecast/models/sarima.hpp"
#include "tsforecast/utils/nelder_mead.hpp"

#include <cstddef>
#include <memory>

namespace tsforecast::models {

/**
 * @brief Fixed order policy used for uploaded series.
 *
 * The non-seasonal order is always used. A seasonal part with the same orders
 * is added once the series holds at least two cycles, with a period of
 * min(max_seasonal_period, n / 2).
 */
struct SelectionPolicy {
	int p = 1;
	int d = 1;
	int q = 1;
	int seasonal_p = 1;
	int seasonal_d = 1;
	int seasonal_q = 1;
	std::size_t seasonal_min_observations = 24;
	int max_seasonal_period = 12;
};

class ModelSelector {
public:
	explicit ModelSelector(SelectionPolicy policy = {},
	                       utils::NelderMeadOptimizer::Options optimizer_options = {});

	/// Orders for a series of @p observations points.
	ModelSpec select(std::size_t observations) const;

	/**
	 * @brief Selects the orders for @p series and fits them.
	 * @throws core::FitError For any failure during estimation, carrying the underlying message.
	 */
	std::unique_ptr<SARIMA> fit(const core::TimeSeries &series) const;

	const SelectionPolicy &policy() const {
		return policy_;
	}

private:
	SelectionPolicy policy_;
	utils::NelderMeadOptimizer::Options optimizer_options_;
};

} // namespace tsforecast::models
