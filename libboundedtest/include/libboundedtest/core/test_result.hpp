#pragma once

#include "libboundedtest/core/bounds.hpp"
#include "libboundedtest/core/test_options.hpp"
#include <array>
#include <cmath>
#include <limits>
#include <string>

namespace libboundedtest {
namespace core {

/**
 * Result of a bounded unit-root test for one statistic
 *
 * Design notes:
 * - Inference fields come from the simulated null distribution for the
 *   estimated c-parameters
 * - kappa is NaN for OLS detrending
 */
struct UnitRootTestResult {
	// ========================================================================
	// Statistic and decision
	// ========================================================================

	/// Canonical statistic name ("mz_alpha", "mz_t", ...)
	std::string statistic_name;

	/// Which statistic this is
	Statistic statistic_type = Statistic::MZ_ALPHA;

	/// Value of the test statistic
	double statistic = std::numeric_limits<double>::quiet_NaN();

	/// Share of simulated null draws at or below the statistic
	double p_value = std::numeric_limits<double>::quiet_NaN();

	/// Left-tail critical values at 1%, 5% and 10%
	std::array<double, 3> critical_values = {{std::numeric_limits<double>::quiet_NaN(),
	                                          std::numeric_limits<double>::quiet_NaN(),
	                                          std::numeric_limits<double>::quiet_NaN()}};

	/// statistic < 5% critical value
	bool reject_5pct = false;

	// ========================================================================
	// Bound and detrending information
	// ========================================================================

	/// Bounds distance from the initial observation in units of s*sqrt(T): {lower, upper}
	std::array<double, 2> c_parameters = {{std::numeric_limits<double>::quiet_NaN(),
	                                       std::numeric_limits<double>::quiet_NaN()}};

	/// GLS noncentrality parameter (alpha_bar = 1 - kappa / T)
	double kappa = std::numeric_limits<double>::quiet_NaN();

	/// Estimated mean removed by detrending
	double mean_estimate = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Long-run variance
	// ========================================================================

	/// Long-run variance of the detrended series
	double lrv_estimate = std::numeric_limits<double>::quiet_NaN();

	/// Autoregressive lag order (selected for AR, ADF statistics)
	size_t lag_order = 0;

	/// Kernel bandwidth (NaN for the autoregressive estimator)
	double bandwidth = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Configuration echo
	// ========================================================================

	Bounds bounds;
	DetrendingMethod detrending = DetrendingMethod::GLS_BOUNDS;
	LrvMethod lrv_method = LrvMethod::AUTOREGRESSIVE;
	size_t n_obs = 0;
	size_t replications = 0;

	double critical_value_1pct() const {
		return critical_values[0];
	}

	double critical_value_5pct() const {
		return critical_values[1];
	}

	double critical_value_10pct() const {
		return critical_values[2];
	}

	bool has_kappa() const {
		return std::isfinite(kappa);
	}
};

} // namespace core
} // namespace libboundedtest
