#pragma once

#include "libboundedtest/core/bounds.hpp"
#include "libboundedtest/core/test_result.hpp"
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace boundedtest {

using libboundedtest::core::Bounds;
using libboundedtest::core::UnitRootTestResult;

/**
 * Results of one bounded_unit_root_test call
 *
 * Holds one entry per computed statistic, keyed by statistic name.
 * statistic = "all" fills every statistic; otherwise exactly one entry.
 */
struct TestReport {
	std::map<std::string, UnitRootTestResult> results;
	bool all_statistics = false;

	/**
	 * The single result of a one-statistic call
	 *
	 * @throws std::logic_error if the report holds more than one result
	 */
	const UnitRootTestResult &Single() const;

	std::map<std::string, UnitRootTestResult>::const_iterator begin() const {
		return results.begin();
	}

	std::map<std::string, UnitRootTestResult>::const_iterator end() const {
		return results.end();
	}

	size_t size() const {
		return results.size();
	}
};

/**
 * Bounded AR(1) series: x_t = m + rho (x_{t-1} - m) + sigma e_t regulated
 * into the bounds, m the midpoint, started at m, first burnin values dropped
 *
 * @return exactly T values, all inside the bounds
 * @throws std::runtime_error wrapping the validation error on invalid input
 */
std::vector<double> GenerateBoundedAR1(size_t T, const Bounds &bounds, double rho, double sigma, size_t burnin,
                                       std::mt19937_64 &rng);

/**
 * Unit-root test for a bounded series
 *
 * @param statistic      mz_alpha | mz_t | msb | adf_alpha | adf_t | all
 * @param detrending     ols | gls_ers | gls_bounds
 * @param lrv_method     np | ar
 * @param extra_options  Further keys understood by OptionsParser
 *                       (kernel, bandwidth, lag_criterion, max_lag,
 *                       replications, simulation_steps, seed)
 * @throws std::runtime_error naming the call, with the cause nested
 */
TestReport BoundedUnitRootTest(const std::vector<double> &data, const Bounds &bounds,
                               const std::string &statistic = "mz_alpha", const std::string &detrending = "gls_bounds",
                               const std::string &lrv_method = "ar",
                               const std::map<std::string, std::string> &extra_options = {});

} // namespace boundedtest
