#pragma once

#include "libboundedtest/core/test_options.hpp"
#include "libboundedtest/lrv/long_run_variance.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libboundedtest {
namespace statistics {

/**
 * M-statistics of a detrended series
 */
struct MStatistics {
	double mz_alpha = std::numeric_limits<double>::quiet_NaN();
	double mz_t = std::numeric_limits<double>::quiet_NaN();
	double msb = std::numeric_limits<double>::quiet_NaN();
};

/**
 * ADF-type statistics from an autoregressive fit
 */
struct AdfStatistics {
	double adf_alpha = std::numeric_limits<double>::quiet_NaN();
	double adf_t = std::numeric_limits<double>::quiet_NaN();
};

/**
 * Unit-root test statistics
 *
 * With ytilde the detrended series of length T and s2 a long-run variance:
 *
 *   MZ_alpha = (T^-1 (ytilde_T^2 - ytilde_1^2) - s2) / (2 T^-2 sum_{t=2..T} ytilde_{t-1}^2)
 *   MSB      = sqrt(T^-2 sum_{t=2..T} ytilde_{t-1}^2 / s2)
 *   MZ_t     = MZ_alpha * MSB
 *
 * and from the ADF regression dy_t = b0 y_{t-1} + sum b_j dy_{t-j} + e_t:
 *
 *   ADF_alpha = T b0 / (1 - sum b_j),  ADF_t = b0 / se(b0)
 *
 * All statistics are left-tailed.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class UnitRootStatistics {
public:
	/**
	 * @throws std::invalid_argument if T < 3 or s2 is not positive
	 * @throws std::runtime_error if the series is identically zero
	 */
	static MStatistics ComputeM(const Eigen::VectorXd &ytilde, double s2);

	/**
	 * @param n_obs Sample size T scaling ADF_alpha
	 * @throws std::runtime_error if the fit is degenerate
	 */
	static AdfStatistics ComputeADF(const lrv::AutoregressiveFit &fit, size_t n_obs);

	/// Select one statistic out of the computed families
	static double Select(core::Statistic statistic, const MStatistics &m, const AdfStatistics &adf);

	/// Whether the statistic needs the ADF regression
	static bool IsAdfStatistic(core::Statistic statistic) {
		return statistic == core::Statistic::ADF_ALPHA || statistic == core::Statistic::ADF_T;
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline MStatistics UnitRootStatistics::ComputeM(const Eigen::VectorXd &ytilde, double s2) {
	const Eigen::Index T = ytilde.size();
	if (T < 3) {
		throw std::invalid_argument("M-statistics require at least 3 observations");
	}
	if (!std::isfinite(s2) || s2 <= 0.0) {
		throw std::invalid_argument("long-run variance must be positive (got " + std::to_string(s2) + ")");
	}

	const double t = static_cast<double>(T);
	const double scaled_sum = ytilde.head(T - 1).squaredNorm() / (t * t);
	if (scaled_sum <= 0.0) {
		throw std::runtime_error("M-statistics are undefined for an identically zero detrended series");
	}

	const double first = ytilde[0];
	const double last = ytilde[T - 1];

	MStatistics result;
	result.mz_alpha = ((last * last - first * first) / t - s2) / (2.0 * scaled_sum);
	result.msb = std::sqrt(scaled_sum / s2);
	result.mz_t = result.mz_alpha * result.msb;
	return result;
}

inline AdfStatistics UnitRootStatistics::ComputeADF(const lrv::AutoregressiveFit &fit, size_t n_obs) {
	const double denom = 1.0 - fit.sum_lags;
	if (std::abs(denom) < 1e-8 || !std::isfinite(fit.beta0)) {
		throw std::runtime_error("ADF statistics are undefined: degenerate autoregressive fit");
	}

	AdfStatistics result;
	result.adf_alpha = static_cast<double>(n_obs) * fit.beta0 / denom;
	result.adf_t = fit.beta0 / fit.beta0_se;
	return result;
}

inline double UnitRootStatistics::Select(core::Statistic statistic, const MStatistics &m, const AdfStatistics &adf) {
	switch (statistic) {
	case core::Statistic::MZ_ALPHA:
		return m.mz_alpha;
	case core::Statistic::MZ_T:
		return m.mz_t;
	case core::Statistic::MSB:
		return m.msb;
	case core::Statistic::ADF_ALPHA:
		return adf.adf_alpha;
	case core::Statistic::ADF_T:
		return adf.adf_t;
	}
	throw std::invalid_argument("unknown statistic");
}

} // namespace statistics
} // namespace libboundedtest
