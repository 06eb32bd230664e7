#pragma once

#include "libboundedtest/core/bounds.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

namespace libboundedtest {
namespace simulation {

/// How a proposed value outside the bounds is brought back inside
enum class BoundaryScheme {
	REGULATED, // Minimal regulator: the value sticks to the violated bound
	REFLECTING // Mirror image about the violated bound, folded into the interval
};

/**
 * Parameters of a bounded AR(1) series
 *
 *   x_t = m + rho * (x_{t-1} - m) + sigma * e_t,  e_t ~ N(0, 1)
 *
 * with m the midpoint of the bounds and every x_t brought back into the
 * bounds by the boundary scheme. rho = 1 gives a bounded random walk.
 */
struct GeneratorOptions {
	/// Number of returned observations
	size_t n_obs = 100;

	/// Interval the series is confined to
	core::Bounds bounds {-5.0, 5.0};

	/// Autoregressive coefficient, |rho| <= 1
	double rho = 1.0;

	/// Innovation standard deviation
	double sigma = 1.0;

	/// Leading values discarded before the first returned observation
	size_t burnin = 0;

	BoundaryScheme scheme = BoundaryScheme::REGULATED;

	/// Starting value x_0 (NaN = midpoint of the bounds)
	double initial_value = std::numeric_limits<double>::quiet_NaN();

	double StartValue() const {
		return std::isnan(initial_value) ? bounds.Midpoint() : initial_value;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		bounds.Validate();
		if (n_obs == 0) {
			throw std::invalid_argument("n_obs must be positive");
		}
		if (!std::isfinite(rho) || std::abs(rho) > 1.0) {
			throw std::invalid_argument("rho must satisfy |rho| <= 1 (got " + std::to_string(rho) + ")");
		}
		if (!std::isfinite(sigma) || sigma <= 0.0) {
			throw std::invalid_argument("sigma must be positive (got " + std::to_string(sigma) + ")");
		}
		if (!bounds.Contains(StartValue())) {
			throw std::invalid_argument("initial_value " + std::to_string(StartValue()) + " lies outside the bounds");
		}
	}
};

/**
 * Simulation of bounded (regulated) autoregressive and Ornstein-Uhlenbeck
 * processes
 *
 * All generators draw from a caller-owned std::mt19937_64, so a fixed seed
 * reproduces the same path. Every generated value lies in the bounds.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class BoundedProcessGenerator {
public:
	/**
	 * Bring a value back into [lower, upper]
	 *
	 * REGULATED clamps to the violated bound. REFLECTING folds the value with
	 * period 2 * width, which equals repeated mirroring for large overshoots.
	 */
	static double Regulate(double x, double lower, double upper, BoundaryScheme scheme);

	/**
	 * Bounded AR(1) series of length options.n_obs after options.burnin
	 * discarded values
	 *
	 * @throws std::invalid_argument if options are invalid
	 */
	static Eigen::VectorXd GenerateBoundedAR1(const GeneratorOptions &options, std::mt19937_64 &rng);

	/**
	 * Regulated Ornstein-Uhlenbeck path by the Euler scheme
	 *
	 *   X_{t+dt} = X_t + theta * (mu - X_t) * dt + sigma * sqrt(dt) * e_t
	 *
	 * regulated at the bounds after every step. Returns n values, x0 excluded.
	 * theta = 0 gives a regulated Brownian motion.
	 *
	 * @throws std::invalid_argument on invalid parameters
	 */
	static Eigen::VectorXd GenerateRegulatedOU(size_t n, const core::Bounds &bounds, double theta, double mu,
	                                           double sigma, double dt, double x0, std::mt19937_64 &rng,
	                                           BoundaryScheme scheme = BoundaryScheme::REGULATED);

	/**
	 * Unit-variance random walk started at 0 and regulated at [lower, upper]
	 *
	 * Fills every element of path; used to simulate null distributions, so it
	 * writes into preallocated storage. Requires lower <= 0 <= upper.
	 */
	static void FillRegulatedRandomWalk(double lower, double upper, std::mt19937_64 &rng, Eigen::VectorXd &path);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double BoundedProcessGenerator::Regulate(double x, double lower, double upper, BoundaryScheme scheme) {
	if (x >= lower && x <= upper) {
		return x;
	}
	if (scheme == BoundaryScheme::REGULATED) {
		return x < lower ? lower : upper;
	}

	const double width = upper - lower;
	double offset = std::fmod(x - lower, 2.0 * width);
	if (offset < 0.0) {
		offset += 2.0 * width;
	}
	return offset <= width ? lower + offset : lower + 2.0 * width - offset;
}

inline Eigen::VectorXd BoundedProcessGenerator::GenerateBoundedAR1(const GeneratorOptions &options,
                                                                     std::mt19937_64 &rng) {
	options.Validate();

	std::normal_distribution<double> normal(0.0, 1.0);
	const double mid = options.bounds.Midpoint();
	const size_t total = options.burnin + options.n_obs;

	Eigen::VectorXd series(static_cast<Eigen::Index>(options.n_obs));
	double x = options.StartValue();
	for (size_t t = 0; t < total; t++) {
		x = mid + options.rho * (x - mid) + options.sigma * normal(rng);
		x = Regulate(x, options.bounds.lower, options.bounds.upper, options.scheme);
		if (t >= options.burnin) {
			series[static_cast<Eigen::Index>(t - options.burnin)] = x;
		}
	}
	return series;
}

inline Eigen::VectorXd BoundedProcessGenerator::GenerateRegulatedOU(size_t n, const core::Bounds &bounds, double theta,
                                                                      double mu, double sigma, double dt, double x0,
                                                                      std::mt19937_64 &rng, BoundaryScheme scheme) {
	bounds.Validate();
	if (n == 0) {
		throw std::invalid_argument("n must be positive");
	}
	if (!std::isfinite(theta) || theta < 0.0) {
		throw std::invalid_argument("theta must be non-negative (got " + std::to_string(theta) + ")");
	}
	if (!std::isfinite(sigma) || sigma <= 0.0) {
		throw std::invalid_argument("sigma must be positive (got " + std::to_string(sigma) + ")");
	}
	if (!std::isfinite(dt) || dt <= 0.0) {
		throw std::invalid_argument("dt must be positive (got " + std::to_string(dt) + ")");
	}
	if (!std::isfinite(mu)) {
		throw std::invalid_argument("mu must be finite");
	}
	if (!bounds.Contains(x0)) {
		throw std::invalid_argument("x0 " + std::to_string(x0) + " lies outside the bounds");
	}

	std::normal_distribution<double> normal(0.0, 1.0);
	const double diffusion = sigma * std::sqrt(dt);

	Eigen::VectorXd path(static_cast<Eigen::Index>(n));
	double x = x0;
	for (Eigen::Index t = 0; t < path.size(); t++) {
		x += theta * (mu - x) * dt + diffusion * normal(rng);
		x = Regulate(x, bounds.lower, bounds.upper, scheme);
		path[t] = x;
	}
	return path;
}

inline void BoundedProcessGenerator::FillRegulatedRandomWalk(double lower, double upper, std::mt19937_64 &rng,
                                                             Eigen::VectorXd &path) {
	if (!(lower <= 0.0 && upper >= 0.0)) {
		throw std::invalid_argument("regulated random walk requires lower <= 0 <= upper");
	}

	std::normal_distribution<double> normal(0.0, 1.0);
	double x = 0.0;
	for (Eigen::Index t = 0; t < path.size(); t++) {
		x += normal(rng);
		if (x < lower) {
			x = lower;
		} else if (x > upper) {
			x = upper;
		}
		path[t] = x;
	}
}

} // namespace simulation
} // namespace libboundedtest
