#pragma once

#include "libboundedtest/core/test_options.hpp"
#include "libboundedtest/detrending/detrender.hpp"
#include "libboundedtest/lrv/long_run_variance.hpp"
#include "libboundedtest/simulation/regulated_process.hpp"
#include "libboundedtest/statistics/unit_root_statistics.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace libboundedtest {
namespace inference {

/**
 * Null distribution to simulate for a given set of c-parameters
 */
struct SimulationSpec {
	double c_lower = 0.0;
	double c_upper = 0.0;

	/// Steps per simulated path
	size_t n_steps = 100;

	core::DetrendingMethod detrending = core::DetrendingMethod::GLS_BOUNDS;

	/// Noncentrality for GLS detrending (ignored for OLS)
	double kappa = 7.0;

	size_t replications = 2000;
	uint64_t seed = 20140101;

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!std::isfinite(c_lower) || !std::isfinite(c_upper) || c_lower > 0.0 || c_upper < 0.0) {
			throw std::invalid_argument("c-parameters must satisfy c_lower <= 0 <= c_upper (got [" +
			                            std::to_string(c_lower) + ", " + std::to_string(c_upper) + "])");
		}
		if (c_lower == c_upper) {
			throw std::invalid_argument("c-parameters must span a non-empty interval");
		}
		if (n_steps < 20) {
			throw std::invalid_argument("n_steps must be at least 20 (got " + std::to_string(n_steps) + ")");
		}
		if (replications < 100) {
			throw std::invalid_argument("replications must be at least 100 (got " + std::to_string(replications) +
			                            ")");
		}
	}
};

/**
 * Bound-dependent critical values by simulation
 *
 * Under the unit-root null a bounded series behaves asymptotically like a
 * Brownian motion regulated at c_lower and c_upper. Each replication draws a
 * unit-variance random walk of n steps regulated at [c_lower sqrt(n),
 * c_upper sqrt(n)], detrends it as the data were detrended and evaluates the
 * statistics with a unit long-run variance (M-statistics) or the lag-0
 * Dickey-Fuller regression (ADF statistics).
 *
 * Draws are returned sorted ascending. The generator is seeded from the spec,
 * so identical specs give identical distributions.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class BoundedCriticalValues {
public:
	/// Significance levels reported as critical values
	static std::array<double, 3> Levels() {
		return {{0.01, 0.05, 0.10}};
	}

	/**
	 * Simulate the null distribution of each requested statistic
	 *
	 * @return statistic -> sorted draws (length = replications)
	 * @throws std::invalid_argument for invalid simulation settings
	 */
	static std::map<core::Statistic, std::vector<double>> Simulate(const SimulationSpec &spec,
	                                                              const std::vector<core::Statistic> &requested);

	/**
	 * Empirical quantile with linear interpolation between order statistics
	 *
	 * @throws std::invalid_argument for empty draws or p outside [0, 1]
	 */
	static double Quantile(const std::vector<double> &sorted_draws, double p);

	/// Share of draws at or below the statistic
	static double PValue(const std::vector<double> &sorted_draws, double statistic);

	/// Quantiles at Levels()
	static std::array<double, 3> CriticalValues(const std::vector<double> &sorted_draws);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::map<core::Statistic, std::vector<double>>
BoundedCriticalValues::Simulate(const SimulationSpec &spec, const std::vector<core::Statistic> &requested) {
	spec.Validate();
	if (requested.empty()) {
		throw std::invalid_argument("no statistics requested for simulation");
	}

	bool need_adf = false;
	std::map<core::Statistic, std::vector<double>> draws;
	for (auto statistic : requested) {
		draws[statistic].reserve(spec.replications);
		need_adf = need_adf || statistics::UnitRootStatistics::IsAdfStatistic(statistic);
	}

	std::mt19937_64 rng(spec.seed);
	const double scale = std::sqrt(static_cast<double>(spec.n_steps));
	const double lower = spec.c_lower * scale;
	const double upper = spec.c_upper * scale;

	Eigen::VectorXd path(static_cast<Eigen::Index>(spec.n_steps));
	for (size_t rep = 0; rep < spec.replications; rep++) {
		simulation::BoundedProcessGenerator::FillRegulatedRandomWalk(lower, upper, rng, path);

		const auto detrended = spec.detrending == core::DetrendingMethod::OLS
		                           ? detrending::Detrender::DemeanOLS(path)
		                           : detrending::Detrender::QuasiDifferenceGLS(path, spec.kappa);

		const auto m = statistics::UnitRootStatistics::ComputeM(detrended.series, 1.0);
		statistics::AdfStatistics adf;
		if (need_adf) {
			const auto fit = lrv::LongRunVariance::FitADF(detrended.series, 0, 1);
			adf = statistics::UnitRootStatistics::ComputeADF(fit, spec.n_steps);
		}

		for (auto &entry : draws) {
			entry.second.push_back(statistics::UnitRootStatistics::Select(entry.first, m, adf));
		}
	}

	for (auto &entry : draws) {
		std::sort(entry.second.begin(), entry.second.end());
	}
	return draws;
}

inline double BoundedCriticalValues::Quantile(const std::vector<double> &sorted_draws, double p) {
	if (sorted_draws.empty()) {
		throw std::invalid_argument("quantile of an empty distribution");
	}
	if (!(p >= 0.0 && p <= 1.0)) {
		throw std::invalid_argument("quantile level must lie in [0, 1] (got " + std::to_string(p) + ")");
	}

	const double position = p * static_cast<double>(sorted_draws.size() - 1);
	const auto below = static_cast<size_t>(std::floor(position));
	const size_t above = std::min(below + 1, sorted_draws.size() - 1);
	const double fraction = position - static_cast<double>(below);
	return sorted_draws[below] + fraction * (sorted_draws[above] - sorted_draws[below]);
}

inline double BoundedCriticalValues::PValue(const std::vector<double> &sorted_draws, double statistic) {
	if (sorted_draws.empty()) {
		throw std::invalid_argument("p-value from an empty distribution");
	}
	const auto count = std::upper_bound(sorted_draws.begin(), sorted_draws.end(), statistic) - sorted_draws.begin();
	return static_cast<double>(count) / static_cast<double>(sorted_draws.size());
}

inline std::array<double, 3> BoundedCriticalValues::CriticalValues(const std::vector<double> &sorted_draws) {
	const auto levels = Levels();
	std::array<double, 3> values;
	for (size_t i = 0; i < levels.size(); i++) {
		values[i] = Quantile(sorted_draws, levels[i]);
	}
	return values;
}

} // namespace inference
} // namespace libboundedtest
