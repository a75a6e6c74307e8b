#include "tsforecast/models/model_selector.hpp"

#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/logging.hpp"

#include <algorithm>
#include <exception>

namespace tsforecast::models {

ModelSelector::ModelSelector(SelectionPolicy policy, utils::NelderMeadOptimizer::Options optimizer_options)
    : policy_(policy), optimizer_options_(optimizer_options) {
}

ModelSpec ModelSelector::select(std::size_t observations) const {
	ModelSpec spec;
	spec.p = policy_.p;
	spec.d = policy_.d;
	spec.q = policy_.q;
	if (observations >= policy_.seasonal_min_observations) {
		spec.P = policy_.seasonal_p;
		spec.D = policy_.seasonal_d;
		spec.Q = policy_.seasonal_q;
		spec.period = std::min(policy_.max_seasonal_period, static_cast<int>(observations / 2));
	}
	return spec;
}

std::unique_ptr<SARIMA> ModelSelector::fit(const core::TimeSeries &series) const {
	const ModelSpec spec = select(series.size());
	if (spec.isSeasonal()) {
		TSFORECAST_INFO("Selected SARIMA{}x{} for {} observations.", spec.orderString(), spec.seasonalOrderString(),
		                series.size());
	} else {
		TSFORECAST_INFO("Selected ARIMA{} for {} observations (below {} for a seasonal part).", spec.orderString(),
		                series.size(), policy_.seasonal_min_observations);
	}

	try {
		auto model = SARIMABuilder().withSpec(spec).withOptimizerOptions(optimizer_options_).build();
		model->fit(series);
		return model;
	} catch (const core::FitError &) {
		throw;
	} catch (const std::exception &ex) {
		throw core::FitError(std::string("Model fitting failed: ") + ex.what());
	}
}

} // namespace tsforecast::models
