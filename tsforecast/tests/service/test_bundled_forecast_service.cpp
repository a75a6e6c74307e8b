#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "common/stub_renderer.hpp"
#include "common/temp_directory.hpp"
#include "common/time_series_helpers.hpp"
#include "tsforecast/io/model_store.hpp"
#include "tsforecast/models/model_selector.hpp"
#include "tsforecast/service/bundled_forecast_service.hpp"

#include <memory>

using tsforecast::service::BundledForecastService;
using tsforecast::service::ServiceConfig;
using Catch::Matchers::ContainsSubstring;
using namespace tests::helpers;

namespace {

ServiceConfig quietConfig() {
	ServiceConfig config = tsforecast::service::bundledServiceConfig();
	config.render_chart = false;
	return config;
}

// Trains the passenger model into a fresh directory.
void storePassengerModel(const std::string &directory) {
	const auto series = makeSeries(airPassengers(), date(1949, 1, 1), tsforecast::core::Frequency::MonthStart,
	                               "#Passengers");
	const auto model = tsforecast::models::ModelSelector().fit(series);
	tsforecast::io::ModelStore(directory).save(*model, series);
}

} // namespace

TEST_CASE("Bundled service forecasts from stored artifacts", "[service][bundled]") {
	const TempDirectory dir;
	storePassengerModel(dir.path());
	const BundledForecastService service(dir.path(), quietConfig());
	REQUIRE(service.isLoaded());
	REQUIRE(service.loadError().empty());

	SECTION("status") {
		const auto status = service.status();
		REQUIRE(status.success);
		REQUIRE(status.model_loaded);
		REQUIRE(status.model_info.has_value());
		REQUIRE(status.model_info->model_type == "SARIMAX");
		REQUIRE(status.model_info->order == "(1, 1, 1)");
		REQUIRE(status.model_info->seasonal_order == std::optional<std::string>("(1, 1, 1, 12)"));
		REQUIRE(status.model_info->data_points == 144);
		REQUIRE(status.model_info->last_date == "1960-12");

		const auto json = status.toJson();
		REQUIRE(json["model_loaded"].asBool());
		REQUIRE(json["model_info"]["seasonal_order"].asString() == "(1, 1, 1, 12)");
	}

	SECTION("forecast") {
		const auto response = service.forecast(12);
		REQUIRE(response.success);
		REQUIRE(response.steps == 12);
		REQUIRE(response.predictions.dates.size() == 12);
		REQUIRE(response.predictions.dates.front() == "1961-01");
		REQUIRE(response.predictions.dates.back() == "1961-12");
		REQUIRE(response.historical_data.dates.size() == 144);
		REQUIRE(response.historical_data.dates.front() == "1949-01");
		REQUIRE_FALSE(response.plot.has_value());
		for (std::size_t i = 0; i < 12; ++i) {
			REQUIRE(response.predictions.lower_ci[i] < response.predictions.values[i]);
			REQUIRE(response.predictions.values[i] < response.predictions.upper_ci[i]);
		}

		const auto json = response.toJson();
		REQUIRE(json["success"].asBool());
		REQUIRE(json["steps"].asInt() == 12);
		REQUIRE(json["predictions"]["lower_ci"].size() == 12);
		REQUIRE(json["historical_data"]["values"].size() == 144);
		REQUIRE(json["model_info"]["data_points"].asUInt64() == 144);
		REQUIRE_FALSE(json.isMember("plot"));

		REQUIRE(service.forecast(12).predictions.values == response.predictions.values);
	}

	SECTION("invalid horizon") {
		const auto response = service.forecast(0);
		REQUIRE_FALSE(response.success);
		REQUIRE_THAT(response.error, ContainsSubstring("at least 1"));
		const auto json = response.toJson();
		REQUIRE(json.size() == 2);
		REQUIRE(json["error"].asString() == response.error);
	}
}

TEST_CASE("Bundled service attaches an encoded chart on request", "[service][bundled][chart]") {
	const TempDirectory dir;
	storePassengerModel(dir.path());
	auto renderer = std::make_shared<StubRenderer>();
	const BundledForecastService service(dir.path(), quietConfig(), renderer);

	REQUIRE_FALSE(service.forecast(3).plot.has_value());
	const auto response = service.forecast(3, true);
	REQUIRE(response.success);
	REQUIRE(response.plot == std::optional<std::string>("iVBORw=="));
	REQUIRE(response.toJson()["plot"].asString() == "iVBORw==");
	REQUIRE(renderer->calls() == 1);
}

TEST_CASE("Bundled service degrades when artifacts are missing", "[service][bundled][edge]") {
	const TempDirectory dir;
	const BundledForecastService service(dir.path(), quietConfig());
	REQUIRE_FALSE(service.isLoaded());
	REQUIRE_FALSE(service.loadError().empty());

	const auto status = service.status();
	REQUIRE(status.success);
	REQUIRE_FALSE(status.model_loaded);
	REQUIRE(status.toJson()["model_info"]["error"].asString() == "model not loaded");

	const auto response = service.forecast(12);
	REQUIRE_FALSE(response.success);
	REQUIRE_THAT(response.error, ContainsSubstring("model not loaded"));
}
