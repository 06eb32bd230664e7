#pragma once

#include "libboundedtest/core/test_options.hpp"
#include "libboundedtest/regression/ols_solver.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace libboundedtest {
namespace lrv {

/**
 * Augmented Dickey-Fuller regression on a detrended series
 *
 *   dy_t = b0 * y_{t-1} + sum_{j=1..k} b_j * dy_{t-j} + e_t
 */
struct AutoregressiveFit {
	double beta0 = std::numeric_limits<double>::quiet_NaN();
	double beta0_se = std::numeric_limits<double>::quiet_NaN();

	/// sum_{j=1..k} b_j
	double sum_lags = 0.0;

	/// SSR / n_eff
	double innovation_variance = std::numeric_limits<double>::quiet_NaN();

	/// sum of y_{t-1}^2 over the estimation sample
	double sum_sq_lagged = std::numeric_limits<double>::quiet_NaN();

	size_t lag_order = 0;
	size_t n_eff = 0;
};

/**
 * Long-run variance estimate
 */
struct LrvResult {
	double value = std::numeric_limits<double>::quiet_NaN();
	core::LrvMethod method = core::LrvMethod::AUTOREGRESSIVE;

	/// Selected AR lag (0 for the kernel estimator)
	size_t lag_order = 0;

	/// Kernel bandwidth (NaN for the AR estimator)
	double bandwidth = std::numeric_limits<double>::quiet_NaN();

	/// Short-run variance: gamma_0 (kernel) or SSR / n_eff (AR)
	double innovation_variance = std::numeric_limits<double>::quiet_NaN();

	/// ADF regression at the selected lag (AR estimator only)
	AutoregressiveFit ar_fit;
	bool has_ar_fit = false;
};

/**
 * Long-run variance estimators for unit-root statistics
 *
 * Nonparametric: kernel-weighted autocovariances of the residuals u_t of
 * y_t = beta * y_{t-1} + u_t,
 *
 *   s2 = gamma_0 + 2 * sum_j k(j / (l + 1)) * gamma_j
 *
 * (the quadratic spectral kernel uses k(j / l) over all lags).
 *
 * Autoregressive: s2_AR = s2_k / (1 - sum b_j)^2 from the ADF regression at
 * lag k, with k selected on a common sample of T - kmax - 1 observations
 * by MAIC, AIC or BIC and then re-estimated on all T - k - 1 observations.
 *
 * Design notes:
 * - Header-only
 * - Input is an already detrended series (no deterministics in the regressions)
 * - Stateless design (all methods are static)
 */
class LongRunVariance {
public:
	/// floor(12 * (T / 100)^(1/4))
	static size_t DefaultMaxLag(size_t n_obs);

	/**
	 * Largest lag to consider: max_lag, or DefaultMaxLag when negative
	 *
	 * @throws std::invalid_argument if the common sample would leave no residual degrees of freedom
	 */
	static size_t ResolveMaxLag(size_t n_obs, int max_lag);

	/// Newey-West rule-of-thumb bandwidth for the kernel
	static double DefaultBandwidth(size_t n_obs, core::Kernel kernel);

	/// Kernel weight k(x)
	static double KernelWeight(core::Kernel kernel, double x);

	/**
	 * Kernel estimator
	 *
	 * @param bandwidth Bandwidth (< 0 = DefaultBandwidth)
	 * @throws std::invalid_argument for fewer than 3 observations
	 * @throws std::runtime_error if the estimate is not positive relative to
	 *         the scale of the series
	 */
	static LrvResult Nonparametric(const Eigen::VectorXd &y, core::Kernel kernel = core::Kernel::BARTLETT,
	                               double bandwidth = -1.0);

	/**
	 * ADF regression at lag k with dependent observations t = start..T-1
	 *
	 * @throws std::invalid_argument if the sample is too short for k lags
	 */
	static AutoregressiveFit FitADF(const Eigen::VectorXd &y, size_t lag_order, size_t start);

	/// Lag minimizing the criterion over 0..max_lag on a common sample
	static size_t SelectLag(const Eigen::VectorXd &y, size_t max_lag, core::LagCriterion criterion);

	/**
	 * s2_k / (1 - sum b_j)^2 for a fitted ADF regression
	 *
	 * @param scale Variance scale of the series; estimates below 1e-12 * scale
	 *              count as zero
	 * @throws std::runtime_error if 1 - sum b_j is numerically zero or the
	 *         estimate is not positive
	 */
	static double SpectralValue(const AutoregressiveFit &fit, double scale);

	/**
	 * Autoregressive spectral estimator at frequency zero
	 *
	 * @param max_lag Largest lag considered (< 0 = DefaultMaxLag)
	 * @throws std::invalid_argument if max_lag is too large for the sample
	 * @throws std::runtime_error if 1 - sum b_j is numerically zero or the
	 *         estimate is negligible relative to the series
	 */
	static LrvResult Autoregressive(const Eigen::VectorXd &y, int max_lag = -1,
	                                core::LagCriterion criterion = core::LagCriterion::MAIC);

	/// Dispatch on options.lrv_method
	static LrvResult Estimate(const Eigen::VectorXd &y, const core::UnitRootTestOptions &options);

	/// Relative size below which a long-run variance is treated as zero
	static constexpr double NEGLIGIBLE = 1e-12;

private:
	static void RequirePositive(double value, double scale, const char *estimator);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline size_t LongRunVariance::DefaultMaxLag(size_t n_obs) {
	return static_cast<size_t>(std::floor(12.0 * std::pow(static_cast<double>(n_obs) / 100.0, 0.25)));
}

inline size_t LongRunVariance::ResolveMaxLag(size_t n_obs, int max_lag) {
	const size_t kmax = max_lag < 0 ? DefaultMaxLag(n_obs) : static_cast<size_t>(max_lag);
	// Common sample of T - kmax - 1 observations must leave residual degrees of freedom
	if (n_obs < 2 * kmax + 4) {
		throw std::invalid_argument("max_lag " + std::to_string(kmax) + " is too large for " + std::to_string(n_obs) +
		                            " observations");
	}
	return kmax;
}

inline double LongRunVariance::DefaultBandwidth(size_t n_obs, core::Kernel kernel) {
	const double scale = static_cast<double>(n_obs) / 100.0;
	switch (kernel) {
	case core::Kernel::BARTLETT:
		return std::floor(4.0 * std::pow(scale, 2.0 / 9.0));
	case core::Kernel::PARZEN:
		return std::floor(4.0 * std::pow(scale, 4.0 / 25.0));
	case core::Kernel::QUADRATIC_SPECTRAL:
		return 4.0 * std::pow(scale, 2.0 / 25.0);
	}
	throw std::invalid_argument("unknown kernel");
}

inline double LongRunVariance::KernelWeight(core::Kernel kernel, double x) {
	const double ax = std::abs(x);
	switch (kernel) {
	case core::Kernel::BARTLETT:
		return ax <= 1.0 ? 1.0 - ax : 0.0;
	case core::Kernel::PARZEN:
		if (ax <= 0.5) {
			return 1.0 - 6.0 * ax * ax + 6.0 * ax * ax * ax;
		}
		return ax <= 1.0 ? 2.0 * std::pow(1.0 - ax, 3) : 0.0;
	case core::Kernel::QUADRATIC_SPECTRAL: {
		if (ax == 0.0) {
			return 1.0;
		}
		const double pi = std::acos(-1.0);
		const double z = 6.0 * pi * ax / 5.0;
		return 25.0 / (12.0 * pi * pi * ax * ax) * (std::sin(z) / z - std::cos(z));
	}
	}
	throw std::invalid_argument("unknown kernel");
}

inline void LongRunVariance::RequirePositive(double value, double scale, const char *estimator) {
	if (!std::isfinite(value) || value <= 0.0 || value <= NEGLIGIBLE * scale) {
		std::ostringstream msg;
		msg << estimator << " long-run variance is not positive (" << value << " against a series scale of " << scale
		    << ")";
		throw std::runtime_error(msg.str());
	}
}

inline LrvResult LongRunVariance::Nonparametric(const Eigen::VectorXd &y, core::Kernel kernel, double bandwidth) {
	const Eigen::Index T = y.size();
	if (T < 3) {
		throw std::invalid_argument("nonparametric long-run variance requires at least 3 observations");
	}

	// Residuals of the first-order autoregression
	const Eigen::MatrixXd lagged = y.head(T - 1);
	auto fit = regression::OLSSolver::Fit(y.tail(T - 1), lagged, core::RegressionOptions::NoIntercept());
	const Eigen::VectorXd &u = fit.residuals;
	const Eigen::Index n = u.size();

	const double l = bandwidth < 0.0 ? DefaultBandwidth(static_cast<size_t>(T), kernel) : bandwidth;

	const double gamma0 = u.squaredNorm() / static_cast<double>(n);
	double value = gamma0;
	for (Eigen::Index j = 1; j < n; j++) {
		double x;
		if (kernel == core::Kernel::QUADRATIC_SPECTRAL) {
			if (l <= 0.0) {
				break;
			}
			x = static_cast<double>(j) / l;
		} else {
			x = static_cast<double>(j) / (l + 1.0);
			if (x > 1.0) {
				break;
			}
		}
		const double weight = KernelWeight(kernel, x);
		const double gamma_j = u.tail(n - j).dot(u.head(n - j)) / static_cast<double>(n);
		value += 2.0 * weight * gamma_j;
	}

	RequirePositive(value, std::max(gamma0, y.squaredNorm() / static_cast<double>(T)), "nonparametric");

	LrvResult result;
	result.value = value;
	result.method = core::LrvMethod::NONPARAMETRIC;
	result.bandwidth = l;
	result.innovation_variance = gamma0;
	return result;
}

inline AutoregressiveFit LongRunVariance::FitADF(const Eigen::VectorXd &y, size_t lag_order, size_t start) {
	const auto T = static_cast<size_t>(y.size());
	const size_t n_params = lag_order + 1;
	if (start < lag_order + 1 || start >= T || T - start <= n_params) {
		throw std::invalid_argument("ADF regression with " + std::to_string(lag_order) + " lags needs more than " +
		                            std::to_string(n_params) + " observations (have " +
		                            std::to_string(start < T ? T - start : 0) + ")");
	}

	const size_t n_eff = T - start;
	const auto rows = static_cast<Eigen::Index>(n_eff);
	Eigen::VectorXd dy(rows);
	Eigen::MatrixXd X(rows, static_cast<Eigen::Index>(n_params));
	for (Eigen::Index r = 0; r < rows; r++) {
		const Eigen::Index t = static_cast<Eigen::Index>(start) + r;
		dy[r] = y[t] - y[t - 1];
		X(r, 0) = y[t - 1];
		for (Eigen::Index j = 1; j <= static_cast<Eigen::Index>(lag_order); j++) {
			X(r, j) = y[t - j] - y[t - j - 1];
		}
	}

	auto fit = regression::OLSSolver::FitWithStdErrors(dy, X, core::RegressionOptions::NoIntercept());
	if (fit.is_aliased[0]) {
		throw std::runtime_error("ADF regression is degenerate: lagged level is collinear with the lagged differences");
	}

	AutoregressiveFit result;
	result.lag_order = lag_order;
	result.n_eff = n_eff;
	result.beta0 = fit.coefficients[0];
	result.beta0_se = fit.std_errors[0];
	for (size_t j = 1; j < n_params; j++) {
		if (!fit.is_aliased[j]) {
			result.sum_lags += fit.coefficients[static_cast<Eigen::Index>(j)];
		}
	}
	result.innovation_variance = fit.ssr / static_cast<double>(n_eff);
	result.sum_sq_lagged = X.col(0).squaredNorm();
	return result;
}

inline size_t LongRunVariance::SelectLag(const Eigen::VectorXd &y, size_t max_lag, core::LagCriterion criterion) {
	const size_t start = max_lag + 1;

	size_t best_lag = 0;
	double best_value = std::numeric_limits<double>::infinity();
	for (size_t k = 0; k <= max_lag; k++) {
		auto fit = FitADF(y, k, start);
		const double n = static_cast<double>(fit.n_eff);
		const double s2 = fit.innovation_variance;
		if (!(s2 > 0.0)) {
			continue;
		}

		double value = std::log(s2);
		switch (criterion) {
		case core::LagCriterion::MAIC: {
			const double tau = fit.beta0 * fit.beta0 * fit.sum_sq_lagged / s2;
			value += 2.0 * (tau + static_cast<double>(k)) / n;
			break;
		}
		case core::LagCriterion::AIC:
			value += 2.0 * static_cast<double>(k) / n;
			break;
		case core::LagCriterion::BIC:
			value += static_cast<double>(k) * std::log(n) / n;
			break;
		}

		if (value < best_value) {
			best_value = value;
			best_lag = k;
		}
	}
	return best_lag;
}

inline double LongRunVariance::SpectralValue(const AutoregressiveFit &fit, double scale) {
	const double denom = 1.0 - fit.sum_lags;
	if (std::abs(denom) < 1e-8) {
		throw std::runtime_error("autoregressive long-run variance is not identified: lag coefficients sum to one");
	}
	const double value = fit.innovation_variance / (denom * denom);
	RequirePositive(value, std::max(fit.innovation_variance, scale), "autoregressive");
	return value;
}

inline LrvResult LongRunVariance::Autoregressive(const Eigen::VectorXd &y, int max_lag, core::LagCriterion criterion) {
	const size_t kmax = ResolveMaxLag(static_cast<size_t>(y.size()), max_lag);
	const size_t k = SelectLag(y, kmax, criterion);
	auto fit = FitADF(y, k, k + 1);

	LrvResult result;
	result.value = SpectralValue(fit, y.squaredNorm() / static_cast<double>(y.size()));
	result.method = core::LrvMethod::AUTOREGRESSIVE;
	result.lag_order = k;
	result.innovation_variance = fit.innovation_variance;
	result.ar_fit = fit;
	result.has_ar_fit = true;
	return result;
}

inline LrvResult LongRunVariance::Estimate(const Eigen::VectorXd &y, const core::UnitRootTestOptions &options) {
	if (options.lrv_method == core::LrvMethod::NONPARAMETRIC) {
		return Nonparametric(y, options.kernel, options.bandwidth);
	}
	return Autoregressive(y, options.max_lag, options.lag_criterion);
}

} // namespace lrv
} // namespace libboundedtest
