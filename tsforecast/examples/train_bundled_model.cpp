// Offline trainer for the bundled monthly model: evaluates the fixed
// SARIMA(1,1,1)x(1,1,1,12) on a holdout, then refits on the full series and
// writes model.json and series.json.

#include "tsforecast/core/errors.hpp"
#include "tsforecast/io/csv_reader.hpp"
#include "tsforecast/io/model_store.hpp"
#include "tsforecast/models/sarima.hpp"
#include "tsforecast/pipeline/schema_inferencer.hpp"
#include "tsforecast/pipeline/series_regularizer.hpp"
#include "tsforecast/utils/logging.hpp"
#include "tsforecast/utils/metrics.hpp"

#include <boost/program_options.hpp>

#include <cmath>
#include <exception>
#include <iostream>
#include <string>

using namespace tsforecast;

namespace po = boost::program_options;

namespace {

struct TrainerOptions {
	std::string data_path = "data/air_passengers.csv";
	std::string output_dir = "model";
	double train_fraction = 0.8;
	std::string log_level = "info";
	spdlog::level::level_enum level = spdlog::level::info;
};

models::ModelSpec bundledSpec() {
	models::ModelSpec spec;
	spec.p = 1;
	spec.d = 1;
	spec.q = 1;
	spec.P = 1;
	spec.D = 1;
	spec.Q = 1;
	spec.period = 12;
	return spec;
}

bool parseCommandLine(int argc, const char *const *argv, TrainerOptions &options) {
	try {
		po::options_description desc("Usage: tsforecast_train [options]\nOptions");
		desc.add_options()
		    ("help", "Display this information and exit")
		    ("data", po::value<std::string>(&options.data_path)->default_value(options.data_path),
		     "Monthly CSV dataset to train on")
		    ("output", po::value<std::string>(&options.output_dir)->default_value(options.output_dir),
		     "Directory receiving model.json and series.json")
		    ("train-fraction", po::value<double>(&options.train_fraction)->default_value(options.train_fraction),
		     "Share of the series used for the holdout fit")
		    ("log-level", po::value<std::string>(&options.log_level)->default_value(options.log_level),
		     "trace, debug, info, warning, error, critical or off");

		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);
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
	if (!(options.train_fraction > 0.0 && options.train_fraction < 1.0)) {
		std::cerr << "--train-fraction must lie strictly between 0 and 1" << std::endl;
		return false;
	}
	return true;
}

void evaluateHoldout(const core::TimeSeries &series, double train_fraction) {
	const auto train_size = static_cast<std::size_t>(std::floor(train_fraction * static_cast<double>(series.size())));
	if (train_size < 2 || train_size >= series.size()) {
		TSFORECAST_WARN("Holdout split leaves no test points; skipping evaluation");
		return;
	}
	const core::TimeSeries train = series.slice(0, train_size);
	const core::TimeSeries test = series.slice(train_size, series.size());

	auto model = models::SARIMABuilder().withSpec(bundledSpec()).build();
	model->fit(train);
	const auto forecast = model->predictWithConfidence(static_cast<int>(test.size()), 0.95);
	const auto score = utils::HoldoutEvaluator::score(test.getValues(), forecast);
	TSFORECAST_INFO("Holdout of SARIMA{}x{} trained on {} points: {}", bundledSpec().orderString(),
	                bundledSpec().seasonalOrderString(), train.size(), score.summary());
}

} // namespace

int main(int argc, char **argv) {
	TrainerOptions options;
	if (!parseCommandLine(argc, argv, options)) {
		return 2;
	}
	utils::Logging::init(options.level);

	try {
		const core::RawTable table = io::CsvReader().readFile(options.data_path);
		const auto choice = pipeline::SchemaInferencer().infer(table);
		const core::TimeSeries series =
		    pipeline::SeriesRegularizer().regularize(table, choice.time_column, choice.value_column);
		TSFORECAST_INFO("Training on '{}' ({} points)", choice.value_column, series.size());

		evaluateHoldout(series, options.train_fraction);

		auto model = models::SARIMABuilder().withSpec(bundledSpec()).build();
		model->fit(series);
		io::ModelStore(options.output_dir).save(*model, series);
	} catch (const std::exception &e) {
		TSFORECAST_CRITICAL("Training failed: {}", e.what());
		return 1;
	}
	return 0;
}
