#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "tsforecast/utils/metrics.hpp"

using tsforecast::core::Forecast;
using tsforecast::utils::HoldoutEvaluator;

namespace {

Forecast pointsOnly(std::vector<double> point) {
	Forecast forecast;
	forecast.point = std::move(point);
	return forecast;
}

} // namespace

TEST_CASE("Holdout error statistics", "[utils][metrics]") {
	const auto score = HoldoutEvaluator::score({1.0, 2.0, 3.0}, pointsOnly({1.5, 2.5, 2.0}));
	REQUIRE(score.points == 3);
	REQUIRE(score.mae == Catch::Approx(2.0 / 3.0));
	REQUIRE(score.rmse == Catch::Approx(std::sqrt(1.5 / 3.0)));
	REQUIRE(score.mape.has_value());
	REQUIRE(*score.mape == Catch::Approx((0.5 + 0.25 + 1.0 / 3.0) / 3.0 * 100.0));
	REQUIRE_FALSE(score.coverage.has_value());
}

TEST_CASE("Holdout MAPE skips zero actuals", "[utils][metrics]") {
	REQUIRE_FALSE(HoldoutEvaluator::score({0.0, 0.0}, pointsOnly({1.0, 2.0})).mape.has_value());

	const auto partial = HoldoutEvaluator::score({0.0, 2.0}, pointsOnly({1.0, 3.0}));
	REQUIRE(*partial.mape == Catch::Approx(50.0));
}

TEST_CASE("Holdout coverage counts actuals inside the interval", "[utils][metrics]") {
	Forecast forecast = pointsOnly({1.0, 2.0, 3.0, 9.0});
	forecast.lower = std::vector<double>{0.0, 0.0, 3.0, 0.0};
	forecast.upper = std::vector<double>{2.0, 4.0, 3.0, 9.0};

	const auto score = HoldoutEvaluator::score({1.0, 5.0, 3.0, 10.0}, forecast);
	REQUIRE(score.coverage.has_value());
	REQUIRE(*score.coverage == Catch::Approx(0.5));
	REQUIRE(score.summary() == "RMSE 1.58, MAE 1.00, MAPE 17.50%, coverage 50.0% over 4 points");
}

TEST_CASE("Holdout scoring rejects mismatched input", "[utils][metrics][error]") {
	REQUIRE_THROWS_AS(HoldoutEvaluator::score({1.0, 2.0}, pointsOnly({1.0})), std::invalid_argument);
	REQUIRE_THROWS_AS(HoldoutEvaluator::score({}, pointsOnly({})), std::invalid_argument);
	REQUIRE_THROWS_AS(HoldoutEvaluator::score({std::numeric_limits<double>::quiet_NaN()}, pointsOnly({1.0})),
	                  std::invalid_argument);

	Forecast inverted = pointsOnly({1.0});
	inverted.lower = std::vector<double>{2.0};
	inverted.upper = std::vector<double>{0.0};
	REQUIRE_THROWS_AS(HoldoutEvaluator::score({1.0}, inverted), std::invalid_argument);
}
