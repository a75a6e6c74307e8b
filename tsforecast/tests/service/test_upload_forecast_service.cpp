#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "common/stub_renderer.hpp"
#include "common/time_series_helpers.hpp"
#include "tsforecast/service/upload_forecast_service.hpp"

#include <future>
#include <memory>
#include <sstream>
#include <vector>

using tsforecast::core::Frequency;
using tsforecast::service::ServiceConfig;
using tsforecast::service::UploadForecastService;
using Catch::Matchers::ContainsSubstring;
using namespace tests::helpers;

namespace {

ServiceConfig quietConfig() {
	ServiceConfig config = tsforecast::service::uploadServiceConfig();
	config.render_chart = false;
	return config;
}

std::string csv(const std::string &header, const std::vector<std::string> &dates, const std::vector<double> &values) {
	std::ostringstream out;
	out << header << '\n';
	for (std::size_t i = 0; i < dates.size(); ++i) {
		out << dates[i] << ',' << values[i] << '\n';
	}
	return out.str();
}

std::string dailyCsv(std::size_t count) {
	return csv("Date,Value", dateLabels(date(2024, 1, 1), count, Frequency::Daily), dailyValues(count));
}

} // namespace

TEST_CASE("Upload then forecast", "[service][upload]") {
	UploadForecastService service(quietConfig());
	REQUIRE_FALSE(service.hasData());

	const auto uploaded = service.uploadCsv(dailyCsv(15));
	REQUIRE(uploaded.success);
	REQUIRE(uploaded.message == "Data loaded successfully: 15 points");
	REQUIRE(uploaded.data_info.has_value());
	REQUIRE(uploaded.data_info->data_points == 15);
	REQUIRE(uploaded.data_info->date_range == "2024-01-01 to 2024-01-15");
	REQUIRE(uploaded.data_info->date_column == "Date");
	REQUIRE(uploaded.data_info->value_column == "Value");

	const auto values = dailyValues(15);
	double mean = 0.0;
	for (double v : values) {
		mean += v / 15.0;
	}
	REQUIRE(uploaded.data_info->mean_value == Catch::Approx(mean));
	REQUIRE(uploaded.data_info->std_value > 0.0);

	const auto status = service.status();
	REQUIRE(status.has_custom_data);
	REQUIRE(status.toJson()["data_info"]["data_points"].asUInt64() == 15);

	const auto response = service.forecast(5);
	REQUIRE(response.success);
	REQUIRE(response.predictions.dates ==
	        std::vector<std::string>{"2024-01-16", "2024-01-17", "2024-01-18", "2024-01-19", "2024-01-20"});
	REQUIRE(response.model_info.model_type == "SARIMAX (uploaded data)");
	REQUIRE(response.model_info.frequency == std::optional<std::string>("D"));
	REQUIRE(response.model_info.value_column == std::optional<std::string>("Value"));
	REQUIRE(response.model_info.last_date == "2024-01-15");
	REQUIRE_FALSE(response.model_info.seasonal_order.has_value());

	const auto json = response.toJson();
	REQUIRE(json["model_info"]["seasonal_order"].isNull());
	REQUIRE(json["model_info"]["frequency"].asString() == "D");

	const auto again = service.forecast(5);
	REQUIRE(again.predictions.values == response.predictions.values);
}

TEST_CASE("Forecast without an upload", "[service][upload][edge]") {
	UploadForecastService service(quietConfig());
	const auto response = service.forecast(5);
	REQUIRE_FALSE(response.success);
	REQUIRE(response.error == "No data loaded. Upload a CSV file first.");

	const auto status = service.status();
	REQUIRE(status.success);
	REQUIRE_FALSE(status.has_custom_data);
	REQUIRE(status.toJson()["data_info"].isNull());
}

TEST_CASE("Rejected uploads keep the previous series", "[service][upload][edge]") {
	UploadForecastService service(quietConfig());
	REQUIRE(service.uploadCsv(dailyCsv(12)).success);

	SECTION("text value column") {
		std::ostringstream content;
		content << "Date,Label\n";
		for (const auto &label : dateLabels(date(2024, 1, 1), 12, Frequency::Daily)) {
			content << label << ",item\n";
		}
		const auto response = service.uploadCsv(content.str());
		REQUIRE_FALSE(response.success);
		REQUIRE_THAT(response.error, ContainsSubstring("'Label'"));
		REQUIRE(response.toJson().size() == 2);
	}

	SECTION("too few rows") {
		const auto response = service.uploadCsv(dailyCsv(8));
		REQUIRE_FALSE(response.success);
		REQUIRE_THAT(response.error, ContainsSubstring("at least 10"));
	}

	SECTION("single column") {
		const auto response = service.uploadCsv("Date\n2024-01-01\n");
		REQUIRE_FALSE(response.success);
		REQUIRE_THAT(response.error, ContainsSubstring("at least 2 columns"));
	}

	SECTION("unterminated quote") {
		REQUIRE_FALSE(service.uploadCsv("Date,Value\n\"2024-01-01,1\n").success);
	}

	REQUIRE(service.hasData());
	REQUIRE(service.status().data_info->data_points == 12);
}

TEST_CASE("A new upload replaces the series and its model", "[service][upload]") {
	UploadForecastService service(quietConfig());
	REQUIRE(service.uploadCsv(dailyCsv(15)).success);
	REQUIRE(service.forecast(3).model_info.frequency == std::optional<std::string>("D"));

	const auto monthly = csv("Month,Sales", dateLabels(date(2020, 1, 1), 24, Frequency::MonthStart),
	                         seasonalValues(24));
	REQUIRE(service.uploadCsv(monthly).success);

	const auto response = service.forecast(3);
	REQUIRE(response.success);
	REQUIRE(response.model_info.frequency == std::optional<std::string>("MS"));
	REQUIRE(response.model_info.value_column == std::optional<std::string>("Sales"));
	REQUIRE(response.model_info.seasonal_order == std::optional<std::string>("(1, 1, 1, 12)"));
	REQUIRE(response.predictions.dates.front() == "2022-01-01");

	service.clear();
	REQUIRE_FALSE(service.hasData());
	REQUIRE_FALSE(service.forecast(3).success);
}

TEST_CASE("Concurrent forecasts and uploads", "[service][upload][concurrency]") {
	UploadForecastService service(quietConfig());
	REQUIRE(service.uploadCsv(dailyCsv(15)).success);

	std::vector<std::future<tsforecast::service::ForecastResponse>> pending;
	for (int round = 0; round < 4; ++round) {
		pending.push_back(service.forecastAsync(5));
		REQUIRE(service.uploadCsv(dailyCsv(round % 2 == 0 ? 20 : 15)).success);
	}
	pending.push_back(service.forecastAsync(5));

	for (auto &future : pending) {
		const auto response = future.get();
		REQUIRE(response.success);
		REQUIRE(response.steps == 5);
		const auto history = response.historical_data.dates.size();
		REQUIRE((history == 15 || history == 20));
		REQUIRE(response.model_info.data_points == history);
	}
}

TEST_CASE("A pending forecast outlives the service", "[service][upload][concurrency]") {
	std::future<tsforecast::service::ForecastResponse> pending;
	{
		auto service = std::make_unique<UploadForecastService>(quietConfig());
		REQUIRE(service->uploadCsv(dailyCsv(15)).success);
		pending = service->forecastAsync(4);
	}

	const auto response = pending.get();
	REQUIRE(response.success);
	REQUIRE(response.steps == 4);
	REQUIRE(response.predictions.dates.front() == "2024-01-16");
}

TEST_CASE("Forecasts running past the last representable date fail cleanly", "[service][upload][edge]") {
	UploadForecastService service(quietConfig());
	const auto labels = dateLabels(date(2250, 1, 1), 12, Frequency::YearStart);
	REQUIRE(service.uploadCsv(csv("Year,Value", labels, dailyValues(12))).success);

	const auto far = service.forecast(100);
	REQUIRE_FALSE(far.success);
	REQUIRE_THAT(far.error, ContainsSubstring("outside the supported date range"));

	const auto near = service.forecast(1);
	REQUIRE(near.success);
	REQUIRE(near.predictions.dates == std::vector<std::string>{"2262-01-01"});
}

TEST_CASE("Upload forecast carries a chart when requested", "[service][upload][chart]") {
	auto renderer = std::make_shared<StubRenderer>();
	UploadForecastService service(quietConfig(), renderer);
	REQUIRE(service.uploadCsv(dailyCsv(15)).success);

	const auto response = service.forecast(5, true);
	REQUIRE(response.success);
	REQUIRE(response.plot == std::optional<std::string>("iVBORw=="));
	REQUIRE(renderer->calls() == 1);
}
