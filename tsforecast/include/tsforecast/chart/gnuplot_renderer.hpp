#pragma once

#include "tsforecast/chart/chart_renderer.hpp"

#include <string>

namespace tsforecast::chart {

/**
 * @class GnuplotRenderer
 * @brief Renders charts to PNG by running an external gnuplot process.
 *
 * Each call writes its data and script into a private scratch directory,
 * spawns gnuplot with the pngcairo terminal and reads the image back. The
 * scratch directory is removed afterwards.
 */
class GnuplotRenderer final : public IChartRenderer {
public:
	struct Options {
		int width = 1200;
		int height = 600;
		std::string x_label = "Date";
		std::string y_label = "Value";
		/// Executable name looked up in PATH, or an absolute path.
		std::string executable = "gnuplot";
		/// Parent of the scratch directories; empty for the system temp directory.
		std::string work_dir;
	};

	GnuplotRenderer();
	explicit GnuplotRenderer(Options options);

	std::vector<std::uint8_t> render(const ChartPayload &payload) const override;

	/// True when the configured executable can be found.
	bool isAvailable() const;

	const Options &options() const {
		return options_;
	}

	/// Gnuplot script for a payload whose data files live in @p data_dir.
	std::string buildScript(const ChartPayload &payload, const std::string &data_dir,
	                        const std::string &output_path) const;

private:
	Options options_;
};

} // namespace tsforecast::chart
