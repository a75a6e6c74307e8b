#include "tsforecast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tsforecast::utils {

namespace {

// Mean of every vertex except the worst (last after sorting).
std::vector<double> centroidExcludingWorst(const std::vector<std::vector<double>> &points) {
	const std::size_t n = points.front().size();
	const std::size_t count = points.size() - 1;
	std::vector<double> center(n, 0.0);
	for (std::size_t i = 0; i < count; ++i) {
		for (std::size_t j = 0; j < n; ++j) {
			center[j] += points[i][j];
		}
	}
	for (double &value : center) {
		value /= static_cast<double>(count);
	}
	return center;
}

// from + coefficient * (to - from)
std::vector<double> along(const std::vector<double> &from, const std::vector<double> &to, double coefficient) {
	std::vector<double> out(from.size());
	for (std::size_t i = 0; i < from.size(); ++i) {
		out[i] = from[i] + coefficient * (to[i] - from[i]);
	}
	return out;
}

} // namespace

void NelderMeadOptimizer::enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
                                        const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (!lower.empty()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (!upper.empty()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::valueSpread(const std::vector<Vertex> &simplex) {
	double mean = 0.0;
	for (const auto &vertex : simplex) {
		mean += vertex.value;
	}
	mean /= static_cast<double>(simplex.size());
	double accum = 0.0;
	for (const auto &vertex : simplex) {
		const double diff = vertex.value - mean;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(simplex.size()));
}

double NelderMeadOptimizer::simplexDiameter(const std::vector<Vertex> &simplex) {
	double diameter = 0.0;
	const auto &best = simplex.front().point;
	for (std::size_t i = 1; i < simplex.size(); ++i) {
		for (std::size_t j = 0; j < best.size(); ++j) {
			diameter = std::max(diameter, std::abs(simplex[i].point[j] - best[j]));
		}
	}
	return diameter;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial,
                                                          const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds) const {
	Result result;
	if (initial.empty()) {
		return result;
	}
	const std::size_t n = initial.size();
	if ((!lower_bounds.empty() && lower_bounds.size() != n) || (!upper_bounds.empty() && upper_bounds.size() != n)) {
		throw std::invalid_argument("Nelder-Mead bounds must match the parameter dimension.");
	}

	auto evaluate = [&](std::vector<double> point) {
		enforceBounds(point, lower_bounds, upper_bounds);
		++result.evaluations;
		const double value = objective(point);
		return Vertex{std::move(point), value};
	};

	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);
	simplex.push_back(evaluate(initial));
	for (std::size_t i = 0; i < n; ++i) {
		std::vector<double> point = simplex.front().point;
		// Step away from an upper bound instead of collapsing onto it.
		const bool room_above = upper_bounds.empty() || point[i] + options.step <= upper_bounds[i];
		point[i] += room_above ? options.step : -options.step;
		simplex.push_back(evaluate(std::move(point)));
	}

	const auto byValue = [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; };
	std::sort(simplex.begin(), simplex.end(), byValue);

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		if (valueSpread(simplex) < options.tolerance || simplexDiameter(simplex) < options.x_tolerance) {
			result.converged = true;
			break;
		}

		std::vector<std::vector<double>> points;
		points.reserve(simplex.size());
		for (const auto &vertex : simplex) {
			points.push_back(vertex.point);
		}
		const std::vector<double> center = centroidExcludingWorst(points);
		const Vertex &worst = simplex.back();

		Vertex reflected = evaluate(along(center, worst.point, -options.alpha));
		if (reflected.value < simplex.front().value) {
			Vertex expanded = evaluate(along(center, reflected.point, options.gamma));
			simplex.back() = expanded.value < reflected.value ? std::move(expanded) : std::move(reflected);
		} else if (reflected.value < simplex[simplex.size() - 2].value) {
			simplex.back() = std::move(reflected);
		} else {
			Vertex contracted = evaluate(along(center, worst.point, options.rho));
			if (contracted.value < worst.value) {
				simplex.back() = std::move(contracted);
			} else {
				const std::vector<double> best = simplex.front().point;
				for (std::size_t i = 1; i < simplex.size(); ++i) {
					simplex[i] = evaluate(along(best, simplex[i].point, options.sigma));
				}
			}
		}
		std::sort(simplex.begin(), simplex.end(), byValue);
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace tsforecast::utils
