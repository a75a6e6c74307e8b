#pragma once

#include "tsforecast/models/iforecaster.hpp"
#include "tsforecast/utils/nelder_mead.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast::models {

/**
 * @brief Orders of a SARIMA(p,d,q)(P,D,Q)[period] model.
 *
 * A period below 2 together with zero seasonal orders means no seasonal part.
 */
struct ModelSpec {
	int p = 0;
	int d = 0;
	int q = 0;
	int P = 0;
	int D = 0;
	int Q = 0;
	int period = 0;

	bool isSeasonal() const {
		return period > 1 && (P > 0 || D > 0 || Q > 0);
	}

	/// "(p, d, q)"
	std::string orderString() const;
	/// "(P, D, Q, period)"
	std::string seasonalOrderString() const;

	bool operator==(const ModelSpec &other) const {
		return p == other.p && d == other.d && q == other.q && P == other.P && D == other.D && Q == other.Q &&
		       period == other.period;
	}
};

/// Estimated coefficients, in the sign convention phi(B) = 1 - phi_1 B ..., theta(B) = 1 + theta_1 B ...
struct SARIMAParameters {
	std::vector<double> ar;
	std::vector<double> ma;
	std::vector<double> seasonal_ar;
	std::vector<double> seasonal_ma;
};

class SARIMABuilder;

/**
 * @class SARIMA
 * @brief Multiplicative seasonal ARIMA fitted by conditional sum of squares.
 *
 * The series is differenced to w = (1-B)^d (1-B^s)^D y and the ARMA model
 * phi(B) Phi(B^s) w = theta(B) Theta(B^s) e is estimated by maximising the
 * conditional Gaussian likelihood with a bounded Nelder-Mead search. No
 * intercept is estimated.
 */
class SARIMA final : public IForecaster {
public:
	friend class SARIMABuilder;

	/**
	 * @throws core::FitError If the series is too short for the orders, the
	 *         search does not converge or produces non-finite estimates.
	 */
	void fit(const core::TimeSeries &ts) override;

	/**
	 * @brief Rebuilds a fitted model from stored coefficients without re-estimating.
	 *
	 * Residuals, sigma2 and the information criteria are recomputed from the
	 * series, so a restored model forecasts exactly like the one that was saved.
	 */
	void restore(const core::TimeSeries &ts, const SARIMAParameters &parameters);

	core::Forecast predict(int horizon) const override;
	core::Forecast predictWithConfidence(int horizon, double confidence) const override;

	bool isFitted() const override {
		return is_fitted_;
	}

	std::string getName() const override {
		return "SARIMA";
	}

	const ModelSpec &spec() const {
		return spec_;
	}

	SARIMAParameters parameters() const;

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	const Eigen::VectorXd &seasonalARCoefficients() const {
		return seasonal_ar_coeffs_;
	}
	const Eigen::VectorXd &seasonalMACoefficients() const {
		return seasonal_ma_coeffs_;
	}

	/// One-step residuals on the differenced scale; zero where the likelihood is conditioned away.
	const std::vector<double> &residuals() const {
		return residuals_;
	}
	double sigma2() const {
		return sigma2_;
	}
	double logLikelihood() const {
		return log_likelihood_;
	}
	std::optional<double> aic() const {
		return aic_;
	}
	std::optional<double> bic() const {
		return bic_;
	}
	/// Number of residuals that enter the likelihood.
	std::size_t effectiveObservations() const {
		return effective_observations_;
	}

	static std::vector<double> difference(const std::vector<double> &data, int d);
	static std::vector<double> seasonalDifference(const std::vector<double> &data, int D, int s);

	/// Product of two polynomials given by ascending coefficients.
	static std::vector<double> multiplyPolynomials(const std::vector<double> &lhs, const std::vector<double> &rhs);

	/**
	 * @brief MA(infinity) weights psi_0..psi_{count-1} of m(B) / c(B).
	 *
	 * Both polynomials are in ascending coefficients with a leading 1.
	 */
	static std::vector<double> psiWeights(const std::vector<double> &ar_polynomial,
	                                      const std::vector<double> &ma_polynomial, std::size_t count);

	static double normalQuantile(double p);

private:
	explicit SARIMA(ModelSpec spec, utils::NelderMeadOptimizer::Options optimizer_options);

	std::size_t parameterCount() const;
	std::vector<double> arPolynomial() const;
	std::vector<double> maPolynomial() const;
	std::vector<double> integrationPolynomial() const;
	void prepareSeries(const core::TimeSeries &ts);
	void setCoefficients(const std::vector<double> &packed);
	void computeDiagnostics();
	void logFit() const;

	ModelSpec spec_;
	utils::NelderMeadOptimizer::Options optimizer_options_;
	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	Eigen::VectorXd seasonal_ar_coeffs_;
	Eigen::VectorXd seasonal_ma_coeffs_;
	std::vector<double> history_;
	std::vector<double> differenced_history_;
	std::vector<double> residuals_;
	std::size_t condition_start_ = 0;
	std::size_t effective_observations_ = 0;
	double sigma2_ = 0.0;
	double log_likelihood_ = 0.0;
	std::optional<double> aic_;
	std::optional<double> bic_;
	bool is_fitted_ = false;
};

class SARIMABuilder {
public:
	SARIMABuilder &withAR(int p);
	SARIMABuilder &withDifferencing(int d);
	SARIMABuilder &withMA(int q);
	SARIMABuilder &withSeasonalAR(int P);
	SARIMABuilder &withSeasonalDifferencing(int D);
	SARIMABuilder &withSeasonalMA(int Q);
	SARIMABuilder &withSeasonalPeriod(int s);
	SARIMABuilder &withSpec(const ModelSpec &spec);
	SARIMABuilder &withOptimizerOptions(const utils::NelderMeadOptimizer::Options &options);

	/**
	 * @throws std::invalid_argument For negative orders, a seasonal part without
	 *         a period of at least 2, or a model with no ARMA terms at all.
	 */
	std::unique_ptr<SARIMA> build();

private:
	ModelSpec spec_;
	utils::NelderMeadOptimizer::Options optimizer_options_;
};

} // namespace tsforecast::models
