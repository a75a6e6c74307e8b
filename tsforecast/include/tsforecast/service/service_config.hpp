#pragma once

#include "tsforecast/chart/gnuplot_renderer.hpp"

#include <string>

namespace tsforecast::service {

/// Largest horizon a caller may request from the bundled model.
constexpr int kBundledMaxSteps = 60;
/// Largest horizon a caller may request for uploaded data.
constexpr int kUploadMaxSteps = 100;

/**
 * @brief Presentation and interval settings of one forecast facade.
 */
struct ServiceConfig {
	double confidence_level = 0.95;
	/// strftime format of the dates in responses.
	std::string date_format = "%Y-%m-%d";
	/// Attach a gnuplot renderer when none is injected.
	bool render_chart = true;
	/// model_type reported in model_info.
	std::string model_label = "SARIMAX";
	std::string chart_title = "Forecast";
	chart::GnuplotRenderer::Options renderer;
};

/// Defaults of the facade serving the bundled monthly model.
inline ServiceConfig bundledServiceConfig() {
	ServiceConfig config;
	config.date_format = "%Y-%m";
	config.model_label = "SARIMAX";
	config.chart_title = "Air passenger forecast";
	config.renderer.y_label = "Passengers";
	return config;
}

/// Defaults of the facade serving uploaded data.
inline ServiceConfig uploadServiceConfig() {
	ServiceConfig config;
	config.date_format = "%Y-%m-%d";
	config.model_label = "SARIMAX (uploaded data)";
	config.chart_title = "Forecast of uploaded data";
	return config;
}

} // namespace tsforecast::service
