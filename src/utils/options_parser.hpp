#pragma once

#include "libboundedtest/core/test_options.hpp"
#include <map>
#include <string>

namespace boundedtest {

/**
 * String-keyed configuration of the bounded unit-root test
 *
 * Recognized keys (case-insensitive):
 *   statistic        mz_alpha | mz_t | msb | adf_alpha | adf_t | all
 *   detrending       ols | gls_ers | gls_bounds
 *   lrv_method       np | ar
 *   kernel           bartlett | parzen | qs
 *   bandwidth        number (negative = automatic)
 *   lag_criterion    maic | aic | bic
 *   max_lag          integer (negative = automatic)
 *   replications     positive integer
 *   simulation_steps non-negative integer (0 = sample size)
 *   seed             non-negative integer
 */
class OptionsParser {
public:
	/**
	 * Parse options, starting from the library defaults
	 *
	 * @throws std::invalid_argument on unknown keys, duplicate keys differing
	 *         only in case, malformed numbers, or values rejected by Validate()
	 */
	static libboundedtest::core::UnitRootTestOptions Parse(const std::map<std::string, std::string> &options);

	/// Whether a statistic value requests every statistic
	static bool IsAllStatistics(const std::string &statistic);

private:
	static double ParseDouble(const std::string &key, const std::string &value);
	static long long ParseInteger(const std::string &key, const std::string &value);
	static unsigned long long ParseUnsigned(const std::string &key, const std::string &value);
};

} // namespace boundedtest
