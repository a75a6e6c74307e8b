#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "tsforecast/core/errors.hpp"
#include "tsforecast/models/model_selector.hpp"

#include <limits>
#include <vector>

using tsforecast::models::ModelSelector;
using tsforecast::models::SelectionPolicy;

TEST_CASE("ModelSelector omits the seasonal part below two cycles", "[models][selector]") {
	const ModelSelector selector;

	const auto short_spec = selector.select(23);
	REQUIRE(short_spec.p == 1);
	REQUIRE(short_spec.d == 1);
	REQUIRE(short_spec.q == 1);
	REQUIRE_FALSE(short_spec.isSeasonal());

	const auto seasonal = selector.select(24);
	REQUIRE(seasonal.isSeasonal());
	REQUIRE(seasonal.P == 1);
	REQUIRE(seasonal.D == 1);
	REQUIRE(seasonal.Q == 1);
	REQUIRE(seasonal.period == 12);
}

TEST_CASE("ModelSelector caps the seasonal period", "[models][selector]") {
	SelectionPolicy policy;
	policy.seasonal_min_observations = 10;
	const ModelSelector selector(policy);

	REQUIRE(selector.select(14).period == 7);
	REQUIRE(selector.select(144).period == 12);
}

TEST_CASE("ModelSelector fits short daily series without a seasonal part", "[models][selector]") {
	const ModelSelector selector;
	const auto model = selector.fit(tests::helpers::makeDailySeries(tests::helpers::dailyValues(15)));

	REQUIRE(model->isFitted());
	REQUIRE_FALSE(model->spec().isSeasonal());
	REQUIRE(model->predict(5).horizon() == 5);
}

TEST_CASE("ModelSelector fits a seasonal model from 24 observations", "[models][selector]") {
	const ModelSelector selector;
	const auto model = selector.fit(tests::helpers::makeMonthlySeries(tests::helpers::seasonalValues(24)));

	REQUIRE(model->spec().isSeasonal());
	REQUIRE(model->spec().period == 12);
	REQUIRE(model->predictWithConfidence(12, 0.95).hasIntervals());
}

TEST_CASE("ModelSelector reports estimation problems as FitError", "[models][selector][edge]") {
	const ModelSelector selector;
	std::vector<double> values = tests::helpers::dailyValues(12);
	values[4] = std::numeric_limits<double>::quiet_NaN();

	REQUIRE_THROWS_AS(selector.fit(tests::helpers::makeDailySeries(values)), tsforecast::core::FitError);
}
