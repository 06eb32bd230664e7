#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

namespace libboundedtest {
namespace core {

/**
 * Knobs of OLSSolver
 *
 * Demeaning fits an intercept only; the GLS and ADF regressions run through
 * the origin on already detrended data.
 */
struct RegressionOptions {
	bool intercept = true;

	/// Threshold for the QR rank decision; negative selects Eigen's default
	double qr_tolerance = -1.0;

	RegressionOptions() = default;

	static RegressionOptions OLS(bool with_intercept = true) {
		RegressionOptions opts;
		opts.intercept = with_intercept;
		return opts;
	}

	static RegressionOptions NoIntercept() {
		return OLS(false);
	}

	/// @throws std::invalid_argument for a zero or NaN tolerance
	void Validate() const {
		if (std::isnan(qr_tolerance) || qr_tolerance == 0.0) {
			throw std::invalid_argument("qr_tolerance must be positive or negative for the default threshold (got " +
			                            std::to_string(qr_tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace libboundedtest
