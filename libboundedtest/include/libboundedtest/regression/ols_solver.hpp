#pragma once

#include "libboundedtest/core/regression_options.hpp"
#include "libboundedtest/core/regression_result.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libboundedtest {
namespace regression {

/**
 * Least-squares solver shared by demeaning, the GLS quasi-difference
 * regressions and the augmented Dickey-Fuller regressions.
 *
 * A column-pivoted Householder QR gives the numerical rank of the design;
 * regressors beyond that rank are aliased (NaN coefficient) and the rest are
 * solved from the leading triangular block. With an intercept the columns
 * are centered first, so the constant itself can never be aliased.
 *
 * All methods are static.
 */
class OLSSolver {
public:
	/**
	 * @param y Response (length n)
	 * @param X Regressors (n x p), p may be 0 when an intercept is fitted
	 * @throws std::invalid_argument on empty, mismatched or non-finite input
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                   const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/// Fit and fill std_errors; NaN for aliased columns and saturated fits
	static core::RegressionResult FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                                const core::RegressionOptions &options =
	                                                    core::RegressionOptions::OLS());

private:
	static void ValidateInputs(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                           const core::RegressionOptions &options);

	/// Subtracts the column means of X in place and returns them
	static Eigen::VectorXd CenterColumns(Eigen::MatrixXd &X);

	static Eigen::ColPivHouseholderQR<Eigen::MatrixXd> Decompose(const Eigen::MatrixXd &X,
	                                                            const core::RegressionOptions &options);

	static void ComputeStandardErrors(const Eigen::MatrixXd &X_centered,
	                                  const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr,
	                                  const Eigen::VectorXd &x_means, bool intercept, core::RegressionResult &result);
};

inline void OLSSolver::ValidateInputs(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                      const core::RegressionOptions &options) {
	options.Validate();

	if (y.size() == 0) {
		throw std::invalid_argument("OLS requires at least one observation");
	}
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Design matrix has " + std::to_string(X.rows()) + " rows but response has " +
		                            std::to_string(y.size()) + " observations");
	}
	if (X.cols() == 0 && !options.intercept) {
		throw std::invalid_argument("OLS without intercept requires at least one regressor");
	}
	if (!y.allFinite() || !X.allFinite()) {
		throw std::invalid_argument("OLS inputs must be finite");
	}
}

inline Eigen::VectorXd OLSSolver::CenterColumns(Eigen::MatrixXd &X) {
	if (X.cols() == 0) {
		return Eigen::VectorXd();
	}
	Eigen::VectorXd means = X.colwise().mean().transpose();
	X.rowwise() -= means.transpose();
	return means;
}

inline Eigen::ColPivHouseholderQR<Eigen::MatrixXd> OLSSolver::Decompose(const Eigen::MatrixXd &X,
                                                                       const core::RegressionOptions &options) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (options.qr_tolerance > 0.0) {
		qr.setThreshold(options.qr_tolerance);
	}
	return qr;
}

inline core::RegressionResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                              const core::RegressionOptions &options) {
	ValidateInputs(y, X, options);

	const auto n = static_cast<size_t>(X.rows());
	const auto p = static_cast<size_t>(X.cols());
	const size_t offset = options.intercept ? 1 : 0;

	Eigen::MatrixXd X_work = X;
	Eigen::VectorXd y_work = y;
	Eigen::VectorXd x_means = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(p));
	if (options.intercept) {
		x_means = CenterColumns(X_work);
		y_work.array() -= y.mean();
	}

	core::RegressionResult result(n, p + offset, 0);

	size_t regressor_rank = 0;
	if (p > 0) {
		auto qr = Decompose(X_work, options);
		regressor_rank = static_cast<size_t>(qr.rank());

		if (regressor_rank > 0) {
			const auto r = static_cast<Eigen::Index>(regressor_rank);
			Eigen::VectorXd qty = qr.matrixQ().transpose() * y_work;
			Eigen::VectorXd beta = qr.matrixQR().topLeftCorner(r, r).triangularView<Eigen::Upper>().solve(qty.head(r));

			const auto &perm = qr.colsPermutation().indices();
			for (Eigen::Index k = 0; k < r; k++) {
				const auto column = static_cast<size_t>(perm[k]) + offset;
				result.coefficients[static_cast<Eigen::Index>(column)] = beta[k];
				result.is_aliased[column] = false;
			}
		}
	}
	result.rank = regressor_rank + offset;

	Eigen::VectorXd fitted = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
	for (size_t j = 0; j < p; j++) {
		if (result.is_aliased[j + offset]) {
			continue;
		}
		fitted += result.coefficients[static_cast<Eigen::Index>(j + offset)] * X.col(static_cast<Eigen::Index>(j));
	}

	if (options.intercept) {
		// Recover the constant from the means of the estimated columns
		double intercept = y.mean();
		for (size_t j = 0; j < p; j++) {
			if (!result.is_aliased[j + 1]) {
				intercept -= result.coefficients[static_cast<Eigen::Index>(j + 1)] * x_means[static_cast<Eigen::Index>(j)];
			}
		}
		result.coefficients[0] = intercept;
		result.is_aliased[0] = false;
		result.intercept = intercept;
		result.has_intercept = true;
		fitted.array() += intercept;
	}

	result.residuals = y - fitted;
	result.ssr = result.residuals.squaredNorm();
	if (n > result.rank) {
		// Floor keeps standard errors finite on exact fits
		result.mse = std::max(result.ssr / static_cast<double>(n - result.rank), 1e-20);
	}

	return result;
}

inline core::RegressionResult OLSSolver::FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                           const core::RegressionOptions &options) {
	auto result = Fit(y, X, options);

	result.std_errors =
	    Eigen::VectorXd::Constant(static_cast<Eigen::Index>(result.n_params), std::numeric_limits<double>::quiet_NaN());
	result.has_std_errors = true;
	if (!std::isfinite(result.mse)) {
		return result;
	}

	const double n = static_cast<double>(X.rows());
	if (X.cols() == 0) {
		result.std_errors[0] = std::sqrt(result.mse / n);
		return result;
	}

	Eigen::MatrixXd X_work = X;
	Eigen::VectorXd x_means = Eigen::VectorXd::Zero(X.cols());
	if (options.intercept) {
		x_means = CenterColumns(X_work);
	}

	ComputeStandardErrors(X_work, Decompose(X_work, options), x_means, options.intercept, result);
	return result;
}

inline void OLSSolver::ComputeStandardErrors(const Eigen::MatrixXd &X_centered,
                                             const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr,
                                             const Eigen::VectorXd &x_means, bool intercept,
                                             core::RegressionResult &result) {
	const double n = static_cast<double>(X_centered.rows());
	const auto r = static_cast<Eigen::Index>(qr.rank());
	const auto &perm = qr.colsPermutation().indices();
	const Eigen::Index offset = intercept ? 1 : 0;

	if (r == 0) {
		if (intercept) {
			result.std_errors[0] = std::sqrt(result.mse / n);
		}
		return;
	}

	Eigen::MatrixXd kept(X_centered.rows(), r);
	Eigen::VectorXd kept_means(r);
	for (Eigen::Index k = 0; k < r; k++) {
		kept.col(k) = X_centered.col(perm[k]);
		kept_means[k] = x_means[perm[k]];
	}

	// (X'X)^-1 over the estimated columns
	const Eigen::MatrixXd gram = kept.transpose() * kept;
	const Eigen::MatrixXd gram_inv = gram.ldlt().solve(Eigen::MatrixXd::Identity(r, r));

	for (Eigen::Index k = 0; k < r; k++) {
		result.std_errors[perm[k] + offset] = std::sqrt(result.mse * gram_inv(k, k));
	}
	if (intercept) {
		const double leverage = kept_means.dot(gram_inv * kept_means);
		result.std_errors[0] = std::sqrt(result.mse * (1.0 / n + leverage));
	}
}

} // namespace regression
} // namespace libboundedtest
