#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>

namespace libboundedtest {
namespace core {

/**
 * Least-squares fit used by detrending and the ADF regressions
 *
 * Design notes:
 * - Coefficients follow the column order of the design matrix, shifted by
 *   one when an intercept is fitted (position 0)
 * - Columns dropped by the rank-revealing QR are aliased: NaN coefficient
 *   and NaN standard error
 */
struct RegressionResult {
	Eigen::VectorXd coefficients;
	Eigen::VectorXd residuals;
	std::vector<bool> is_aliased;

	double intercept = 0.0;
	bool has_intercept = false;

	/// Rank of the design matrix, intercept included
	size_t rank;
	size_t n_params;
	size_t n_obs;

	/// Residual sum of squares
	double ssr = std::numeric_limits<double>::quiet_NaN();

	/// SSR / (n_obs - rank); NaN for saturated fits
	double mse = std::numeric_limits<double>::quiet_NaN();

	/// Filled by OLSSolver::FitWithStdErrors
	Eigen::VectorXd std_errors;
	bool has_std_errors = false;

	RegressionResult() : rank(0), n_params(0), n_obs(0) {
	}

	RegressionResult(size_t n_obs_, size_t n_params_, size_t rank_) : rank(rank_), n_params(n_params_), n_obs(n_obs_) {
		coefficients =
		    Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_params_), std::numeric_limits<double>::quiet_NaN());
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.resize(n_params_, true);
	}

	size_t df_residual() const {
		return n_obs > rank ? n_obs - rank : 0;
	}

	/// Every estimated (non-aliased) coefficient is finite
	bool is_valid() const {
		if (rank == 0 || n_params == 0 || n_obs == 0) {
			return false;
		}
		for (size_t i = 0; i < n_params; i++) {
			if (!is_aliased[i] && !std::isfinite(coefficients[static_cast<Eigen::Index>(i)])) {
				return false;
			}
		}
		return true;
	}

	/// Coefficient over its standard error (NaN if aliased or no std errors)
	double t_statistic(size_t i) const {
		if (!has_std_errors || i >= n_params || is_aliased[i]) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		auto idx = static_cast<Eigen::Index>(i);
		return coefficients[idx] / std_errors[idx];
	}
};

} // namespace core
} // namespace libboundedtest
