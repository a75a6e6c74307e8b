// Command-line driver of the two forecast facades. Prints one JSON document
// per invocation on stdout; logs go to stderr.
//
//   tsforecast_cli status
//   tsforecast_cli forecast --steps 12 [--plot]
//   tsforecast_cli upload data.csv --steps 24 [--plot]

#include "tsforecast/service/bundled_forecast_service.hpp"
#include "tsforecast/service/upload_forecast_service.hpp"
#include "tsforecast/utils/logging.hpp"

#include <boost/program_options.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace tsforecast;

namespace po = boost::program_options;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
	std::string command;
	std::string file;
	std::string model_dir = "model";
	int steps = 12;
	bool plot = false;
	std::string log_level = "warn";
	spdlog::level::level_enum level = spdlog::level::warn;
	int json_indent = 2;
};

const char *kUsage = "Usage: tsforecast_cli <status|forecast|upload> [file.csv] [options]\nOptions";

bool parseCommandLine(int argc, const char *const *argv, CliOptions &options) {
	try {
		po::options_description desc(kUsage);
		desc.add_options()
		    ("help", "Display this information and exit")
		    ("model-dir", po::value<std::string>(&options.model_dir)->default_value(options.model_dir),
		     "Directory holding the bundled model artifacts")
		    ("steps", po::value<int>(&options.steps)->default_value(options.steps), "Forecast horizon")
		    ("plot", po::bool_switch(&options.plot), "Attach a base64 PNG chart to the response")
		    ("log-level", po::value<std::string>(&options.log_level)->default_value(options.log_level),
		     "trace, debug, info, warning, error, critical or off")
		    ("json-indent", po::value<int>(&options.json_indent)->default_value(options.json_indent),
		     "Spaces per indentation level of the output, 0 for one line");

		po::options_description hidden;
		hidden.add_options()
		    ("command", po::value<std::string>(&options.command))
		    ("file", po::value<std::string>(&options.file));

		po::options_description all;
		all.add(desc).add(hidden);

		po::positional_options_description positional;
		positional.add("command", 1).add("file", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
		if (vm.count("help") > 0) {
			std::cerr << desc << std::endl;
			return false;
		}
		po::notify(vm);
	} catch (const std::exception &e) {
		std::cerr << "Error processing command line: " << e.what() << std::endl;
		return false;
	}

	const auto level = utils::Logging::parseLevel(options.log_level);
	if (!level) {
		std::cerr << "Unknown --log-level '" << options.log_level << "'" << std::endl;
		return false;
	}
	options.level = *level;
	if (options.command != "status" && options.command != "forecast" && options.command != "upload") {
		std::cerr << kUsage << std::endl;
		return false;
	}
	if (options.command == "upload" && options.file.empty()) {
		std::cerr << "upload needs a CSV file" << std::endl;
		return false;
	}
	const int max_steps = options.command == "upload" ? service::kUploadMaxSteps : service::kBundledMaxSteps;
	if (options.command != "status" && (options.steps < 1 || options.steps > max_steps)) {
		std::cerr << "--steps must be between 1 and " << max_steps << std::endl;
		return false;
	}
	if (options.json_indent < 0) {
		std::cerr << "--json-indent must not be negative" << std::endl;
		return false;
	}
	return true;
}

int emit(const Json::Value &document, bool success, int indent) {
	std::cout << service::toJsonString(document, indent) << std::endl;
	return success ? kExitSuccess : kExitFailure;
}

int runUpload(const CliOptions &options, const service::ServiceConfig &config) {
	std::ifstream in(options.file, std::ios::binary);
	if (!in) {
		return emit(service::UploadResponse::failure("Cannot open '" + options.file + "'.").toJson(), false,
		            options.json_indent);
	}
	std::ostringstream content;
	content << in.rdbuf();

	service::UploadForecastService service(config);
	const auto uploaded = service.uploadCsv(content.str());
	if (!uploaded.success) {
		return emit(uploaded.toJson(), false, options.json_indent);
	}

	const auto forecast = service.forecastAsync(options.steps, options.plot).get();
	Json::Value document(Json::objectValue);
	document["upload"] = uploaded.toJson();
	document["forecast"] = forecast.toJson();
	return emit(document, forecast.success, options.json_indent);
}

} // namespace

int main(int argc, char **argv) {
	CliOptions options;
	if (!parseCommandLine(argc, argv, options)) {
		return kExitUsage;
	}
	utils::Logging::init(options.level);

	try {
		if (options.command == "upload") {
			return runUpload(options, service::uploadServiceConfig());
		}

		const service::BundledForecastService bundled(options.model_dir);
		if (options.command == "status") {
			const auto status = bundled.status();
			return emit(status.toJson(), status.success, options.json_indent);
		}
		const auto forecast = bundled.forecast(options.steps, options.plot);
		return emit(forecast.toJson(), forecast.success, options.json_indent);
	} catch (const std::exception &e) {
		TSFORECAST_CRITICAL("{}", e.what());
		return kExitFailure;
	}
}
