#include <catch2/catch_all.hpp>
#include "utils/options_parser.hpp"

using namespace boundedtest;
using namespace libboundedtest::core;

TEST_CASE("OptionsParser - Empty map gives the defaults", "[options]") {
	auto opts = OptionsParser::Parse({});
	REQUIRE(opts.statistic == Statistic::MZ_ALPHA);
	REQUIRE_FALSE(opts.all_statistics);
	REQUIRE(opts.detrending == DetrendingMethod::GLS_BOUNDS);
	REQUIRE(opts.lrv_method == LrvMethod::AUTOREGRESSIVE);
	REQUIRE(opts.replications == 2000);
	REQUIRE(opts.seed == 20140101);
}

TEST_CASE("OptionsParser - Every recognized key", "[options]") {
	auto opts = OptionsParser::Parse({{"statistic", "adf_t"},
	                                  {"detrending", "gls_ers"},
	                                  {"lrv_method", "np"},
	                                  {"kernel", "qs"},
	                                  {"bandwidth", "3.5"},
	                                  {"lag_criterion", "bic"},
	                                  {"max_lag", "6"},
	                                  {"replications", "750"},
	                                  {"simulation_steps", "250"},
	                                  {"seed", "99"}});

	REQUIRE(opts.statistic == Statistic::ADF_T);
	REQUIRE(opts.detrending == DetrendingMethod::GLS_ERS);
	REQUIRE(opts.lrv_method == LrvMethod::NONPARAMETRIC);
	REQUIRE(opts.kernel == Kernel::QUADRATIC_SPECTRAL);
	REQUIRE(opts.bandwidth == 3.5);
	REQUIRE(opts.lag_criterion == LagCriterion::BIC);
	REQUIRE(opts.max_lag == 6);
	REQUIRE(opts.replications == 750);
	REQUIRE(opts.simulation_steps == 250);
	REQUIRE(opts.seed == 99);
}

TEST_CASE("OptionsParser - Statistic 'all'", "[options]") {
	REQUIRE(OptionsParser::IsAllStatistics("all"));
	REQUIRE(OptionsParser::IsAllStatistics("ALL"));
	REQUIRE_FALSE(OptionsParser::IsAllStatistics("mz_alpha"));

	auto opts = OptionsParser::Parse({{"statistic", "All"}});
	REQUIRE(opts.all_statistics);
}

TEST_CASE("OptionsParser - Keys and values are case-insensitive", "[options]") {
	auto opts = OptionsParser::Parse({{"Detrending", "OLS"}, {"LRV_METHOD", "Np"}});
	REQUIRE(opts.detrending == DetrendingMethod::OLS);
	REQUIRE(opts.lrv_method == LrvMethod::NONPARAMETRIC);
}

TEST_CASE("OptionsParser - Negative max_lag means automatic", "[options]") {
	auto opts = OptionsParser::Parse({{"max_lag", "-5"}});
	REQUIRE(opts.max_lag == -1);
}

TEST_CASE("OptionsParser - Rejected input", "[options][validation]") {
	SECTION("Unknown key") {
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"alpha", "0.05"}}), std::invalid_argument);
	}

	SECTION("Same key in two spellings") {
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"Seed", "1"}, {"seed", "2"}}), std::invalid_argument);
	}

	SECTION("Unknown value") {
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"detrending", "gls"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"statistic", "pp_t"}}), std::invalid_argument);
	}

	SECTION("Malformed numbers") {
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"bandwidth", "wide"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"replications", "500x"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"max_lag", "2.5"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"seed", ""}}), std::invalid_argument);
	}

	SECTION("Negative counts") {
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"seed", "-1"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"replications", "-500"}}), std::invalid_argument);
	}

	SECTION("Values rejected by validation") {
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"replications", "50"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"simulation_steps", "5"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(OptionsParser::Parse({{"bandwidth", "nan"}}), std::invalid_argument);
	}
}
