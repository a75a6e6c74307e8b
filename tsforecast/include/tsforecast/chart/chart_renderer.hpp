#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast::chart {

/**
 * @brief Historical curve, forecast curve and interval band of one forecast.
 *
 * The curves are plain copies of the pipeline output; nothing here is derived.
 */
struct ChartPayload {
	using TimePoint = std::chrono::system_clock::time_point;

	struct Curve {
		std::string label;
		std::vector<TimePoint> dates;
		std::vector<double> values;
	};

	struct Band {
		std::string label;
		std::vector<TimePoint> dates;
		std::vector<double> lower;
		std::vector<double> upper;
	};

	std::string title;
	Curve historical;
	Curve forecast;
	Band interval;

	/// Encoded image (PNG) when a renderer produced one.
	std::optional<std::vector<std::uint8_t>> image;
};

/**
 * @brief Rasterises a chart payload.
 */
class IChartRenderer {
public:
	virtual ~IChartRenderer() = default;

	/**
	 * @return The encoded image bytes.
	 * @throws std::runtime_error When the backend cannot produce an image.
	 */
	virtual std::vector<std::uint8_t> render(const ChartPayload &payload) const = 0;
};

} // namespace tsforecast::chart
