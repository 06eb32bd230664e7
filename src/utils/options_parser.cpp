#include "options_parser.hpp"

#include <limits>
#include <set>
#include <stdexcept>

namespace boundedtest {

using libboundedtest::core::ToLower;
using libboundedtest::core::UnitRootTestOptions;

bool OptionsParser::IsAllStatistics(const std::string &statistic) {
	return ToLower(statistic) == "all";
}

double OptionsParser::ParseDouble(const std::string &key, const std::string &value) {
	size_t consumed = 0;
	double parsed;
	try {
		parsed = std::stod(value, &consumed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Option '" + key + "' must be a number (got '" + value + "')");
	}
	if (consumed != value.size()) {
		throw std::invalid_argument("Option '" + key + "' must be a number (got '" + value + "')");
	}
	return parsed;
}

long long OptionsParser::ParseInteger(const std::string &key, const std::string &value) {
	size_t consumed = 0;
	long long parsed;
	try {
		parsed = std::stoll(value, &consumed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Option '" + key + "' must be an integer (got '" + value + "')");
	}
	if (consumed != value.size()) {
		throw std::invalid_argument("Option '" + key + "' must be an integer (got '" + value + "')");
	}
	return parsed;
}

unsigned long long OptionsParser::ParseUnsigned(const std::string &key, const std::string &value) {
	const long long parsed = ParseInteger(key, value);
	if (parsed < 0) {
		throw std::invalid_argument("Option '" + key + "' must be non-negative (got '" + value + "')");
	}
	return static_cast<unsigned long long>(parsed);
}

UnitRootTestOptions OptionsParser::Parse(const std::map<std::string, std::string> &options) {
	UnitRootTestOptions opts;
	std::set<std::string> seen;

	for (const auto &entry : options) {
		const std::string key = ToLower(entry.first);
		const std::string &value = entry.second;

		if (!seen.insert(key).second) {
			throw std::invalid_argument("Option '" + key + "' given more than once");
		}

		if (key == "statistic") {
			if (IsAllStatistics(value)) {
				opts.all_statistics = true;
			} else {
				opts.all_statistics = false;
				opts.statistic = libboundedtest::core::ParseStatistic(value);
			}
		} else if (key == "detrending") {
			opts.detrending = libboundedtest::core::ParseDetrendingMethod(value);
		} else if (key == "lrv_method") {
			opts.lrv_method = libboundedtest::core::ParseLrvMethod(value);
		} else if (key == "kernel") {
			opts.kernel = libboundedtest::core::ParseKernel(value);
		} else if (key == "bandwidth") {
			opts.bandwidth = ParseDouble(key, value);
		} else if (key == "lag_criterion") {
			opts.lag_criterion = libboundedtest::core::ParseLagCriterion(value);
		} else if (key == "max_lag") {
			const long long max_lag = ParseInteger(key, value);
			if (max_lag > std::numeric_limits<int>::max()) {
				throw std::invalid_argument("Option 'max_lag' is out of range (got '" + value + "')");
			}
			opts.max_lag = max_lag < 0 ? -1 : static_cast<int>(max_lag);
		} else if (key == "replications") {
			opts.replications = static_cast<size_t>(ParseUnsigned(key, value));
		} else if (key == "simulation_steps") {
			opts.simulation_steps = static_cast<size_t>(ParseUnsigned(key, value));
		} else if (key == "seed") {
			opts.seed = static_cast<uint64_t>(ParseUnsigned(key, value));
		} else {
			throw std::invalid_argument("Unknown option '" + entry.first +
			                            "'. Valid options: statistic, detrending, lrv_method, kernel, bandwidth, "
			                            "lag_criterion, max_lag, replications, simulation_steps, seed");
		}
	}

	opts.Validate();
	return opts;
}

} // namespace boundedtest
