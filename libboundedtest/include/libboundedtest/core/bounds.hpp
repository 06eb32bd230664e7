#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

namespace libboundedtest {
namespace core {

/**
 * Closed interval [lower, upper] a bounded process is confined to
 */
struct Bounds {
	double lower = 0.0;
	double upper = 0.0;

	Bounds() = default;
	Bounds(double lower_, double upper_) : lower(lower_), upper(upper_) {}

	double Width() const {
		return upper - lower;
	}

	double Midpoint() const {
		return 0.5 * (lower + upper);
	}

	bool Contains(double x) const {
		return x >= lower && x <= upper;
	}

	/**
	 * @throws std::invalid_argument if a bound is not finite or lower >= upper
	 */
	void Validate() const {
		if (!std::isfinite(lower) || !std::isfinite(upper)) {
			throw std::invalid_argument("bounds must be finite (got [" + std::to_string(lower) + ", " +
			                            std::to_string(upper) + "])");
		}
		if (lower >= upper) {
			throw std::invalid_argument("lower bound must be strictly below upper bound (got [" +
			                            std::to_string(lower) + ", " + std::to_string(upper) + "])");
		}
	}
};

} // namespace core
} // namespace libboundedtest
