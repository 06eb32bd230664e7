#include "include/boundedtest.hpp"

#include "libboundedtest/bounded_unit_root_test.hpp"
#include "libboundedtest/simulation/regulated_process.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

#include <Eigen/Dense>
#include <exception>
#include <stdexcept>

namespace boundedtest {

const UnitRootTestResult &TestReport::Single() const {
	if (results.size() != 1) {
		throw std::logic_error("report holds " + std::to_string(results.size()) +
		                       " results; iterate over it instead of calling Single()");
	}
	return results.begin()->second;
}

std::vector<double> GenerateBoundedAR1(size_t T, const Bounds &bounds, double rho, double sigma, size_t burnin,
                                       std::mt19937_64 &rng) {
	libboundedtest::simulation::GeneratorOptions options;
	options.n_obs = T;
	options.bounds = bounds;
	options.rho = rho;
	options.sigma = sigma;
	options.burnin = burnin;

	try {
		BOUNDEDTEST_DEBUG("generate_bounded_ar1: T=" << T << " bounds=[" << bounds.lower << ", " << bounds.upper
		                                             << "] rho=" << rho << " sigma=" << sigma << " burnin=" << burnin);
		const Eigen::VectorXd series = libboundedtest::simulation::BoundedProcessGenerator::GenerateBoundedAR1(options, rng);
		return std::vector<double>(series.data(), series.data() + series.size());
	} catch (const std::exception &e) {
		BOUNDEDTEST_ERROR("generate_bounded_ar1 failed: " << e.what());
		std::throw_with_nested(std::runtime_error("generate_bounded_ar1(T=" + std::to_string(T) + ") failed"));
	}
}

TestReport BoundedUnitRootTest(const std::vector<double> &data, const Bounds &bounds, const std::string &statistic,
                               const std::string &detrending, const std::string &lrv_method,
                               const std::map<std::string, std::string> &extra_options) {
	const std::string call = "bounded_unit_root_test(statistic='" + statistic + "', detrending='" + detrending +
	                         "', lrv_method='" + lrv_method + "')";

	try {
		std::map<std::string, std::string> config = extra_options;
		for (const auto &entry : {std::make_pair(std::string("statistic"), statistic),
		                          std::make_pair(std::string("detrending"), detrending),
		                          std::make_pair(std::string("lrv_method"), lrv_method)}) {
			if (!config.emplace(entry.first, entry.second).second) {
				throw std::invalid_argument("Option '" + entry.first + "' passed both as argument and in extra_options");
			}
		}
		const auto options = OptionsParser::Parse(config);

		BOUNDEDTEST_DEBUG(call << " on " << data.size() << " observations, replications=" << options.replications
		                       << " seed=" << options.seed);

		const Eigen::VectorXd series = Eigen::Map<const Eigen::VectorXd>(data.data(), static_cast<Eigen::Index>(data.size()));

		BOUNDEDTEST_TIMING_START();
		TestReport report;
		report.all_statistics = options.all_statistics;
		if (options.all_statistics) {
			report.results = libboundedtest::BoundedUnitRootTest::RunAll(series, bounds, options);
		} else {
			auto result = libboundedtest::BoundedUnitRootTest::Run(series, bounds, options);
			report.results.emplace(result.statistic_name, result);
		}
		BOUNDEDTEST_TIMING_END(call);

		for (const auto &entry : report) {
			BOUNDEDTEST_DEBUG(entry.first << " = " << entry.second.statistic << " (5% critical value "
			                             << entry.second.critical_value_5pct() << ", p = " << entry.second.p_value
			                             << ", lrv = " << entry.second.lrv_estimate << ")");
		}
		return report;
	} catch (const std::exception &e) {
		BOUNDEDTEST_ERROR(call << " failed: " << e.what());
		std::throw_with_nested(std::runtime_error(call + " failed"));
	}
}

} // namespace boundedtest
