#pragma once

#include <functional>
#include <limits>
#include <vector>

namespace tsforecast::utils {

/**
 * @brief Derivative-free simplex minimiser with optional box bounds.
 *
 * Candidates that leave the box are projected back onto it before they are
 * evaluated, so the objective is only ever called inside the bounds.
 */
class NelderMeadOptimizer {
public:
	struct Options {
		double alpha = 1.0;      // reflection
		double gamma = 2.0;      // expansion
		double rho = 0.5;        // contraction
		double sigma = 0.5;      // shrink
		double step = 0.1;       // initial simplex step
		int max_iterations = 2000;
		double tolerance = 1e-8; // spread of objective values
		double x_tolerance = 1e-9; // largest vertex distance from the best vertex
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		int evaluations = 0;
		bool converged = false;
	};

	using Objective = std::function<double(const std::vector<double> &)>;

	/**
	 * @throws std::invalid_argument If non-empty bounds do not match the dimension of @p initial.
	 */
	Result minimize(const Objective &objective, const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {},
	                const std::vector<double> &upper_bounds = {}) const;

private:
	struct Vertex {
		std::vector<double> point;
		double value;
	};

	static void enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
	                          const std::vector<double> &upper);

	static double valueSpread(const std::vector<Vertex> &simplex);
	static double simplexDiameter(const std::vector<Vertex> &simplex);
};

} // namespace tsforecast::utils
