#include "tsforecast/models/sarima.hpp"

#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tsforecast::models {

namespace {

constexpr double kCoefficientBound = 0.99;
constexpr double kStartValueBound = 0.9;
// Finite so that the simplex spread stays meaningful next to rejected vertices.
constexpr double kPenalty = 1e10;
constexpr double kMinVariance = 1e-12;
constexpr double kPi = 3.14159265358979323846;
// Residuals kept after conditioning on the first AR lags.
constexpr std::size_t kMinConditionedObservations = 10;

Eigen::VectorXd autocorr(const std::vector<double> &data, int max_lag) {
	const int n = static_cast<int>(data.size());
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(max_lag + 1);
	if (n == 0) {
		return acf;
	}

	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
	double variance = 0.0;
	for (double val : data) {
		const double diff = val - mean;
		variance += diff * diff;
	}
	if (variance == 0.0) {
		return acf;
	}

	acf[0] = 1.0;
	for (int lag = 1; lag <= max_lag && lag < n; ++lag) {
		double covariance = 0.0;
		for (int i = lag; i < n; ++i) {
			covariance += (data[i] - mean) * (data[i - lag] - mean);
		}
		acf[lag] = covariance / variance;
	}
	return acf;
}

// Yule-Walker estimate, used as the starting point of the likelihood search.
Eigen::VectorXd estimate_ar_params(const std::vector<double> &data, int p) {
	if (p == 0) {
		return {};
	}
	if (static_cast<int>(data.size()) <= p) {
		return Eigen::VectorXd::Zero(p);
	}

	const Eigen::VectorXd acf = autocorr(data, p);
	Eigen::MatrixXd R = Eigen::MatrixXd::Zero(p, p);
	for (int i = 0; i < p; ++i) {
		for (int j = 0; j < p; ++j) {
			R(i, j) = acf[std::abs(i - j)];
		}
	}
	const Eigen::VectorXd r = acf.segment(1, p);
	Eigen::VectorXd phi = R.colPivHouseholderQr().solve(r);
	for (int i = 0; i < p; ++i) {
		phi[i] = std::isfinite(phi[i]) ? std::clamp(phi[i], -kStartValueBound, kStartValueBound) : 0.0;
	}
	return phi;
}

/**
 * True when every root of 1 + sign * (c_1 z + ... + c_k z^k) lies outside the
 * unit circle, i.e. every eigenvalue of the companion matrix lies inside it.
 */
bool rootsOutsideUnitCircle(const Eigen::VectorXd &coeffs, double sign) {
	const Eigen::Index k = coeffs.size();
	if (k == 0) {
		return true;
	}
	if (k == 1) {
		return std::abs(coeffs[0]) < 1.0;
	}
	Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(k, k);
	companion.row(0) = -sign * coeffs.transpose();
	companion.block(1, 0, k - 1, k - 1) = Eigen::MatrixXd::Identity(k - 1, k - 1);
	const Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
	if (solver.info() != Eigen::Success) {
		return false;
	}
	return solver.eigenvalues().cwiseAbs().maxCoeff() < 1.0;
}

bool isStationary(const Eigen::VectorXd &ar) {
	return rootsOutsideUnitCircle(ar, -1.0);
}

bool isInvertible(const Eigen::VectorXd &ma) {
	return rootsOutsideUnitCircle(ma, 1.0);
}

// 1 + sign * (c_1 B^lag + c_2 B^{2 lag} + ...)
std::vector<double> lagPolynomial(const Eigen::VectorXd &coeffs, int lag, double sign) {
	std::vector<double> poly(static_cast<std::size_t>(coeffs.size() * lag + 1), 0.0);
	poly[0] = 1.0;
	for (Eigen::Index i = 0; i < coeffs.size(); ++i) {
		poly[static_cast<std::size_t>((i + 1) * lag)] = sign * coeffs[i];
	}
	return poly;
}

/**
 * Conditional residuals of a(B) w = m(B) e with zero pre-sample values.
 * Residuals before @p start are fixed at zero and excluded from the sum.
 * @return the residual sum of squares over [start, n).
 */
double conditionalResiduals(const std::vector<double> &w, const std::vector<double> &ar_poly,
                            const std::vector<double> &ma_poly, std::size_t start, std::vector<double> &residuals) {
	const std::size_t n = w.size();
	residuals.assign(n, 0.0);
	double sse = 0.0;
	for (std::size_t t = start; t < n; ++t) {
		double e = w[t];
		for (std::size_t k = 1; k < ar_poly.size() && k <= t; ++k) {
			e += ar_poly[k] * w[t - k];
		}
		for (std::size_t k = 1; k < ma_poly.size() && k <= t; ++k) {
			e -= ma_poly[k] * residuals[t - k];
		}
		residuals[t] = e;
		sse += e * e;
	}
	return sse;
}

std::string formatCoefficients(const Eigen::VectorXd &coeffs) {
	std::stringstream ss;
	ss << coeffs.transpose();
	return ss.str();
}

std::vector<double> toStdVector(const Eigen::VectorXd &coeffs) {
	return std::vector<double>(coeffs.data(), coeffs.data() + coeffs.size());
}

} // namespace

std::string ModelSpec::orderString() const {
	std::ostringstream out;
	out << '(' << p << ", " << d << ", " << q << ')';
	return out.str();
}

std::string ModelSpec::seasonalOrderString() const {
	std::ostringstream out;
	out << '(' << P << ", " << D << ", " << Q << ", " << period << ')';
	return out.str();
}

SARIMA::SARIMA(ModelSpec spec, utils::NelderMeadOptimizer::Options optimizer_options)
    : spec_(spec), optimizer_options_(optimizer_options) {
	if (spec_.p < 0 || spec_.d < 0 || spec_.q < 0) {
		throw std::invalid_argument("SARIMA orders (p, d, q) must be non-negative.");
	}
	if (spec_.P < 0 || spec_.D < 0 || spec_.Q < 0) {
		throw std::invalid_argument("Seasonal SARIMA orders (P, D, Q) must be non-negative.");
	}
	if (spec_.period < 0) {
		throw std::invalid_argument("Seasonal period must be non-negative.");
	}
	if ((spec_.P > 0 || spec_.Q > 0 || spec_.D > 0) && spec_.period < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for seasonal SARIMA components.");
	}
	if (spec_.p == 0 && spec_.q == 0 && spec_.P == 0 && spec_.Q == 0) {
		throw std::invalid_argument("At least one of p, q, P, or Q must be greater than zero for SARIMA.");
	}
	ar_coeffs_ = Eigen::VectorXd::Zero(spec_.p);
	ma_coeffs_ = Eigen::VectorXd::Zero(spec_.q);
	seasonal_ar_coeffs_ = Eigen::VectorXd::Zero(spec_.P);
	seasonal_ma_coeffs_ = Eigen::VectorXd::Zero(spec_.Q);
}

std::vector<double> SARIMA::difference(const std::vector<double> &data, int d) {
	if (d == 0) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Insufficient data length for requested differencing order.");
	}
	std::vector<double> result = data;
	for (int order = 0; order < d; ++order) {
		for (std::size_t i = result.size() - 1; i > 0; --i) {
			result[i] -= result[i - 1];
		}
		result.erase(result.begin());
	}
	return result;
}

std::vector<double> SARIMA::seasonalDifference(const std::vector<double> &data, int D, int s) {
	if (D == 0 || s <= 1) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(D * s)) {
		throw std::invalid_argument("Insufficient data length for requested seasonal differencing order.");
	}
	const std::size_t lag = static_cast<std::size_t>(s);
	std::vector<double> result = data;
	for (int order = 0; order < D; ++order) {
		std::vector<double> next;
		next.reserve(result.size() - lag);
		for (std::size_t i = lag; i < result.size(); ++i) {
			next.push_back(result[i] - result[i - lag]);
		}
		result = std::move(next);
	}
	return result;
}

std::vector<double> SARIMA::multiplyPolynomials(const std::vector<double> &lhs, const std::vector<double> &rhs) {
	if (lhs.empty() || rhs.empty()) {
		return {};
	}
	std::vector<double> product(lhs.size() + rhs.size() - 1, 0.0);
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		if (lhs[i] == 0.0) {
			continue;
		}
		for (std::size_t j = 0; j < rhs.size(); ++j) {
			product[i + j] += lhs[i] * rhs[j];
		}
	}
	return product;
}

std::vector<double> SARIMA::psiWeights(const std::vector<double> &ar_polynomial,
                                       const std::vector<double> &ma_polynomial, std::size_t count) {
	std::vector<double> psi(count, 0.0);
	for (std::size_t j = 0; j < count; ++j) {
		double value = j == 0 ? 1.0 : (j < ma_polynomial.size() ? ma_polynomial[j] : 0.0);
		for (std::size_t k = 1; k <= j && k < ar_polynomial.size(); ++k) {
			value -= ar_polynomial[k] * psi[j - k];
		}
		psi[j] = value;
	}
	return psi;
}

double SARIMA::normalQuantile(double p) {
	if (p <= 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}
	if (std::abs(p - 0.5) < 1e-10) {
		return 0.0;
	}

	// Acklam's rational approximation.
	static const double a[] = {-3.969683028665376e1, 2.209460984245205e2,  -2.759285104469687e2,
	                           1.38357751867269e2,   -3.066479806614716e1, 2.506628277459239};
	static const double b[] = {-5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2, 6.680131188771972e1,
	                           -1.328068155288572e1};
	static const double c[] = {-7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
	                           -2.549732539343734,    4.374664141464968,     2.938163982698783};
	static const double d[] = {7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996, 3.754408661907416};
	constexpr double p_low = 0.02425;
	constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p <= p_high) {
		const double q = p - 0.5;
		const double r = q * q;
		return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	}
	const double q = std::sqrt(-2.0 * std::log(1.0 - p));
	return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
	       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
}

std::size_t SARIMA::parameterCount() const {
	return static_cast<std::size_t>(spec_.p + spec_.q + spec_.P + spec_.Q);
}

std::vector<double> SARIMA::arPolynomial() const {
	return multiplyPolynomials(lagPolynomial(ar_coeffs_, 1, -1.0),
	                           lagPolynomial(seasonal_ar_coeffs_, std::max(spec_.period, 1), -1.0));
}

std::vector<double> SARIMA::maPolynomial() const {
	return multiplyPolynomials(lagPolynomial(ma_coeffs_, 1, 1.0),
	                           lagPolynomial(seasonal_ma_coeffs_, std::max(spec_.period, 1), 1.0));
}

std::vector<double> SARIMA::integrationPolynomial() const {
	std::vector<double> poly{1.0};
	for (int i = 0; i < spec_.d; ++i) {
		poly = multiplyPolynomials(poly, {1.0, -1.0});
	}
	if (spec_.period > 1) {
		std::vector<double> seasonal(static_cast<std::size_t>(spec_.period + 1), 0.0);
		seasonal.front() = 1.0;
		seasonal.back() = -1.0;
		for (int i = 0; i < spec_.D; ++i) {
			poly = multiplyPolynomials(poly, seasonal);
		}
	}
	return poly;
}

void SARIMA::prepareSeries(const core::TimeSeries &ts) {
	const std::size_t integration_degree = integrationPolynomial().size() - 1;
	if (ts.size() <= integration_degree) {
		throw core::FitError("Series of " + std::to_string(ts.size()) + " observations is too short for differencing " +
		                     spec_.orderString() + (spec_.isSeasonal() ? "x" + spec_.seasonalOrderString() : ""));
	}
	if (ts.hasMissingValues()) {
		throw core::FitError("SARIMA requires a series without missing values.");
	}

	history_ = ts.getValues();
	differenced_history_ = seasonalDifference(difference(history_, spec_.d), spec_.D, spec_.period);
	if (differenced_history_.size() <= parameterCount()) {
		throw core::FitError("Differenced series of " + std::to_string(differenced_history_.size()) +
		                     " observations cannot identify " + std::to_string(parameterCount()) + " coefficients.");
	}

	const std::size_t ar_degree = static_cast<std::size_t>(spec_.p + spec_.P * std::max(spec_.period, 1));
	condition_start_ =
	    differenced_history_.size() >= ar_degree + kMinConditionedObservations ? ar_degree : std::size_t{0};
	effective_observations_ = differenced_history_.size() - condition_start_;
}

void SARIMA::setCoefficients(const std::vector<double> &packed) {
	std::size_t offset = 0;
	auto take = [&](Eigen::VectorXd &target) {
		for (Eigen::Index i = 0; i < target.size(); ++i) {
			target[i] = packed[offset++];
		}
	};
	take(ar_coeffs_);
	take(ma_coeffs_);
	take(seasonal_ar_coeffs_);
	take(seasonal_ma_coeffs_);
}

void SARIMA::computeDiagnostics() {
	const double sse =
	    conditionalResiduals(differenced_history_, arPolynomial(), maPolynomial(), condition_start_, residuals_);
	if (!std::isfinite(sse)) {
		throw core::FitError("SARIMA residuals are not finite for the estimated coefficients.");
	}
	const double n = static_cast<double>(effective_observations_);
	sigma2_ = sse / n;
	log_likelihood_ = -0.5 * n * (std::log(2.0 * kPi * std::max(sigma2_, kMinVariance)) + 1.0);
	const double k = static_cast<double>(parameterCount() + 1);
	aic_ = -2.0 * log_likelihood_ + 2.0 * k;
	bic_ = -2.0 * log_likelihood_ + k * std::log(n);
}

void SARIMA::fit(const core::TimeSeries &ts) {
	is_fitted_ = false;
	prepareSeries(ts);

	const std::size_t n_params = parameterCount();
	std::vector<double> initial(n_params, 0.0);
	const Eigen::VectorXd ar_start = estimate_ar_params(differenced_history_, spec_.p);
	if (isStationary(ar_start)) {
		for (int i = 0; i < spec_.p; ++i) {
			initial[static_cast<std::size_t>(i)] = ar_start[i];
		}
	}

	const double n_eff = static_cast<double>(effective_observations_);
	std::vector<double> scratch;
	auto objective = [&](const std::vector<double> &packed) {
		setCoefficients(packed);
		if (!isStationary(ar_coeffs_) || !isStationary(seasonal_ar_coeffs_) || !isInvertible(ma_coeffs_) ||
		    !isInvertible(seasonal_ma_coeffs_)) {
			return kPenalty;
		}
		const double sse =
		    conditionalResiduals(differenced_history_, arPolynomial(), maPolynomial(), condition_start_, scratch);
		if (!std::isfinite(sse)) {
			return kPenalty;
		}
		return 0.5 * n_eff * std::log(std::max(sse / n_eff, kMinVariance));
	};

	const std::vector<double> lower(n_params, -kCoefficientBound);
	const std::vector<double> upper(n_params, kCoefficientBound);
	utils::NelderMeadOptimizer optimizer;
	const auto result = optimizer.minimize(objective, initial, optimizer_options_, lower, upper);

	if (!result.converged) {
		throw core::FitError("SARIMA likelihood search did not converge after " + std::to_string(result.iterations) +
		                     " iterations.");
	}
	if (!std::isfinite(result.value) || result.value >= kPenalty) {
		throw core::FitError("SARIMA likelihood search found no stationary and invertible coefficients.");
	}

	setCoefficients(result.best);
	computeDiagnostics();
	is_fitted_ = true;
	logFit();
}

void SARIMA::restore(const core::TimeSeries &ts, const SARIMAParameters &parameters) {
	if (parameters.ar.size() != static_cast<std::size_t>(spec_.p) ||
	    parameters.ma.size() != static_cast<std::size_t>(spec_.q) ||
	    parameters.seasonal_ar.size() != static_cast<std::size_t>(spec_.P) ||
	    parameters.seasonal_ma.size() != static_cast<std::size_t>(spec_.Q)) {
		throw std::invalid_argument("Stored SARIMA coefficients do not match the model orders.");
	}
	is_fitted_ = false;
	prepareSeries(ts);

	std::vector<double> packed;
	packed.reserve(parameterCount());
	for (const auto *part : {&parameters.ar, &parameters.ma, &parameters.seasonal_ar, &parameters.seasonal_ma}) {
		packed.insert(packed.end(), part->begin(), part->end());
	}
	for (double value : packed) {
		if (!std::isfinite(value)) {
			throw std::invalid_argument("Stored SARIMA coefficients must be finite.");
		}
	}
	setCoefficients(packed);
	computeDiagnostics();
	is_fitted_ = true;
	TSFORECAST_DEBUG("SARIMA restored from stored coefficients ({} observations).", history_.size());
}

SARIMAParameters SARIMA::parameters() const {
	SARIMAParameters out;
	out.ar = toStdVector(ar_coeffs_);
	out.ma = toStdVector(ma_coeffs_);
	out.seasonal_ar = toStdVector(seasonal_ar_coeffs_);
	out.seasonal_ma = toStdVector(seasonal_ma_coeffs_);
	return out;
}

core::Forecast SARIMA::predict(int horizon) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 1) {
		throw std::invalid_argument("Forecast horizon must be at least 1.");
	}

	const std::vector<double> ar_poly = arPolynomial();
	const std::vector<double> ma_poly = maPolynomial();
	const std::vector<double> delta = integrationPolynomial();

	std::vector<double> w = differenced_history_;
	std::vector<double> e = residuals_;
	std::vector<double> y = history_;
	const std::size_t steps = static_cast<std::size_t>(horizon);
	w.reserve(w.size() + steps);
	e.reserve(e.size() + steps);
	y.reserve(y.size() + steps);

	core::Forecast forecast;
	forecast.point.reserve(steps);
	for (std::size_t h = 0; h < steps; ++h) {
		const std::size_t t = w.size();
		double w_hat = 0.0;
		for (std::size_t k = 1; k < ar_poly.size() && k <= t; ++k) {
			w_hat -= ar_poly[k] * w[t - k];
		}
		for (std::size_t k = 1; k < ma_poly.size() && k <= t; ++k) {
			w_hat += ma_poly[k] * e[t - k];
		}
		w.push_back(w_hat);
		e.push_back(0.0);

		// delta(B) y = w, with delta_0 = 1.
		const std::size_t ty = y.size();
		double y_hat = w_hat;
		for (std::size_t k = 1; k < delta.size(); ++k) {
			y_hat -= delta[k] * y[ty - k];
		}
		y.push_back(y_hat);
		forecast.point.push_back(y_hat);
	}
	return forecast;
}

core::Forecast SARIMA::predictWithConfidence(int horizon, double confidence) const {
	if (confidence <= 0.0 || confidence >= 1.0) {
		throw std::invalid_argument("Confidence level must be between 0 and 1.");
	}

	core::Forecast forecast = predict(horizon);
	const auto &point = forecast.point;
	auto &lower = forecast.lower.emplace();
	auto &upper = forecast.upper.emplace();
	lower.reserve(point.size());
	upper.reserve(point.size());

	if (sigma2_ <= 0.0) {
		TSFORECAST_WARN("Residual variance is non-positive; confidence bounds will be point forecasts.");
		lower = point;
		upper = point;
		return forecast;
	}

	const double z_score = normalQuantile(1.0 - (1.0 - confidence) / 2.0);
	const auto psi = psiWeights(multiplyPolynomials(arPolynomial(), integrationPolynomial()), maPolynomial(),
	                            point.size());
	double cumulative = 0.0;
	for (std::size_t h = 0; h < point.size(); ++h) {
		cumulative += psi[h] * psi[h];
		const double scale = std::sqrt(sigma2_ * cumulative);
		lower.push_back(point[h] - z_score * scale);
		upper.push_back(point[h] + z_score * scale);
	}
	return forecast;
}

void SARIMA::logFit() const {
	if (spec_.isSeasonal()) {
		TSFORECAST_INFO("SARIMA{}x{} model fitted on {} observations.", spec_.orderString(),
		                spec_.seasonalOrderString(), history_.size());
	} else {
		TSFORECAST_INFO("ARIMA{} model fitted on {} observations.", spec_.orderString(), history_.size());
	}
	if (spec_.p > 0) {
		TSFORECAST_DEBUG("Non-seasonal AR coeffs: [{}]", formatCoefficients(ar_coeffs_));
	}
	if (spec_.q > 0) {
		TSFORECAST_DEBUG("Non-seasonal MA coeffs: [{}]", formatCoefficients(ma_coeffs_));
	}
	if (spec_.P > 0) {
		TSFORECAST_DEBUG("Seasonal AR coeffs: [{}]", formatCoefficients(seasonal_ar_coeffs_));
	}
	if (spec_.Q > 0) {
		TSFORECAST_DEBUG("Seasonal MA coeffs: [{}]", formatCoefficients(seasonal_ma_coeffs_));
	}
	TSFORECAST_INFO("SARIMA diagnostics: sigma2 = {:.6f}, AIC = {:.6f}, BIC = {:.6f}", sigma2_, *aic_, *bic_);
}

SARIMABuilder &SARIMABuilder::withAR(int p) {
	spec_.p = p;
	return *this;
}

SARIMABuilder &SARIMABuilder::withDifferencing(int d) {
	spec_.d = d;
	return *this;
}

SARIMABuilder &SARIMABuilder::withMA(int q) {
	spec_.q = q;
	return *this;
}

SARIMABuilder &SARIMABuilder::withSeasonalAR(int P) {
	spec_.P = P;
	return *this;
}

SARIMABuilder &SARIMABuilder::withSeasonalDifferencing(int D) {
	spec_.D = D;
	return *this;
}

SARIMABuilder &SARIMABuilder::withSeasonalMA(int Q) {
	spec_.Q = Q;
	return *this;
}

SARIMABuilder &SARIMABuilder::withSeasonalPeriod(int s) {
	spec_.period = s;
	return *this;
}

SARIMABuilder &SARIMABuilder::withSpec(const ModelSpec &spec) {
	spec_ = spec;
	return *this;
}

SARIMABuilder &SARIMABuilder::withOptimizerOptions(const utils::NelderMeadOptimizer::Options &options) {
	optimizer_options_ = options;
	return *this;
}

std::unique_ptr<SARIMA> SARIMABuilder::build() {
	return std::unique_ptr<SARIMA>(new SARIMA(spec_, optimizer_options_));
}

} // namespace tsforecast::models
