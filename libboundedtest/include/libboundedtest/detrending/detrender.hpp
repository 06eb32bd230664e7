#pragma once

#include "libboundedtest/core/test_options.hpp"
#include "libboundedtest/regression/ols_solver.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libboundedtest {
namespace detrending {

/**
 * Detrended series together with the deterministic component removed
 */
struct DetrendResult {
	/// y_t - psi (length T)
	Eigen::VectorXd series;

	core::DetrendingMethod method = core::DetrendingMethod::OLS;

	/// Estimated constant psi
	double mean_estimate = std::numeric_limits<double>::quiet_NaN();

	/// Noncentrality used for quasi-differencing (NaN for OLS)
	double kappa = std::numeric_limits<double>::quiet_NaN();

	/// 1 - kappa / T (NaN for OLS)
	double alpha_bar = std::numeric_limits<double>::quiet_NaN();
};

/**
 * Removal of the constant from a possibly bounded series
 *
 * OLS demeaning regresses y on a constant. The GLS variants quasi-difference
 * both y and the constant at alpha_bar = 1 - kappa / T, keeping the first
 * observation in levels:
 *
 *   y^a = (y_1, y_2 - alpha_bar * y_1, ..., y_T - alpha_bar * y_{T-1})
 *   z^a = (1,   1 - alpha_bar,         ..., 1 - alpha_bar)
 *
 * and subtract psi = OLS(y^a on z^a) from y. GLS_ERS uses kappa = 7; GLS_BOUNDS
 * lets kappa grow as the bounds tighten around the initial observation.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Regressions go through regression::OLSSolver
 */
class Detrender {
public:
	/// Elliott-Rothenberg-Stock noncentrality for the constant-only model
	static double ErsKappa() {
		return 7.0;
	}

	/**
	 * Bound-dependent noncentrality: 7 * (1 + exp(-(c_upper - c_lower)))
	 *
	 * Equals the ERS value in the limit of wide bounds and doubles it as the
	 * bounds collapse onto the initial observation.
	 *
	 * @throws std::invalid_argument unless c_lower <= c_upper, both finite
	 */
	static double BoundsKappa(double c_lower, double c_upper);

	/// kappa used by a detrending method (NaN for OLS)
	static double KappaFor(core::DetrendingMethod method, double c_lower, double c_upper);

	/// Residuals of y on a constant
	static DetrendResult DemeanOLS(const Eigen::VectorXd &y);

	/**
	 * GLS detrending by quasi-differencing at alpha_bar = 1 - kappa / T
	 *
	 * @throws std::invalid_argument unless 0 < kappa < T
	 */
	static DetrendResult QuasiDifferenceGLS(const Eigen::VectorXd &y, double kappa);

	/**
	 * Detrend with the requested method
	 *
	 * @param c_lower, c_upper c-parameters, only used by GLS_BOUNDS
	 */
	static DetrendResult Detrend(const Eigen::VectorXd &y, core::DetrendingMethod method, double c_lower = 0.0,
	                             double c_upper = 0.0);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double Detrender::BoundsKappa(double c_lower, double c_upper) {
	if (!std::isfinite(c_lower) || !std::isfinite(c_upper) || c_lower > c_upper) {
		throw std::invalid_argument("c-parameters must be finite with c_lower <= c_upper (got [" +
		                            std::to_string(c_lower) + ", " + std::to_string(c_upper) + "])");
	}
	return ErsKappa() * (1.0 + std::exp(-(c_upper - c_lower)));
}

inline double Detrender::KappaFor(core::DetrendingMethod method, double c_lower, double c_upper) {
	switch (method) {
	case core::DetrendingMethod::OLS:
		return std::numeric_limits<double>::quiet_NaN();
	case core::DetrendingMethod::GLS_ERS:
		return ErsKappa();
	case core::DetrendingMethod::GLS_BOUNDS:
		return BoundsKappa(c_lower, c_upper);
	}
	throw std::invalid_argument("unknown detrending method");
}

inline DetrendResult Detrender::DemeanOLS(const Eigen::VectorXd &y) {
	const Eigen::MatrixXd no_regressors(y.size(), 0);
	auto fit = regression::OLSSolver::Fit(y, no_regressors, core::RegressionOptions::OLS(true));

	DetrendResult result;
	result.method = core::DetrendingMethod::OLS;
	result.mean_estimate = fit.intercept;
	result.series = fit.residuals;
	return result;
}

inline DetrendResult Detrender::QuasiDifferenceGLS(const Eigen::VectorXd &y, double kappa) {
	const Eigen::Index T = y.size();
	if (T < 2) {
		throw std::invalid_argument("GLS detrending requires at least 2 observations");
	}
	if (!std::isfinite(kappa) || kappa <= 0.0 || kappa >= static_cast<double>(T)) {
		throw std::invalid_argument("kappa must lie in (0, T) (got " + std::to_string(kappa) + " with T = " +
		                            std::to_string(T) + ")");
	}

	const double alpha_bar = 1.0 - kappa / static_cast<double>(T);

	Eigen::VectorXd y_qd(T);
	Eigen::MatrixXd z_qd(T, 1);
	y_qd[0] = y[0];
	z_qd(0, 0) = 1.0;
	y_qd.tail(T - 1) = y.tail(T - 1) - alpha_bar * y.head(T - 1);
	z_qd.col(0).tail(T - 1).setConstant(1.0 - alpha_bar);

	auto fit = regression::OLSSolver::Fit(y_qd, z_qd, core::RegressionOptions::NoIntercept());
	if (fit.is_aliased[0]) {
		throw std::runtime_error("GLS detrending failed: quasi-differenced constant is degenerate");
	}

	DetrendResult result;
	result.kappa = kappa;
	result.alpha_bar = alpha_bar;
	result.mean_estimate = fit.coefficients[0];
	result.series = y.array() - result.mean_estimate;
	return result;
}

inline DetrendResult Detrender::Detrend(const Eigen::VectorXd &y, core::DetrendingMethod method, double c_lower,
                                        double c_upper) {
	if (method == core::DetrendingMethod::OLS) {
		return DemeanOLS(y);
	}

	auto result = QuasiDifferenceGLS(y, KappaFor(method, c_lower, c_upper));
	result.method = method;
	return result;
}

} // namespace detrending
} // namespace libboundedtest
