#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libboundedtest/simulation/regulated_process.hpp>
#include <Eigen/Dense>
#include <random>

using namespace libboundedtest;
using namespace libboundedtest::simulation;
using namespace libboundedtest::core;

TEST_CASE("Regulate: Values inside the bounds are untouched", "[simulation][boundary]") {
	for (auto scheme : {BoundaryScheme::REGULATED, BoundaryScheme::REFLECTING}) {
		REQUIRE(BoundedProcessGenerator::Regulate(1.5, -5.0, 5.0, scheme) == 1.5);
		REQUIRE(BoundedProcessGenerator::Regulate(-5.0, -5.0, 5.0, scheme) == -5.0);
		REQUIRE(BoundedProcessGenerator::Regulate(5.0, -5.0, 5.0, scheme) == 5.0);
	}
}

TEST_CASE("Regulate: Minimal regulator sticks to the violated bound", "[simulation][boundary]") {
	REQUIRE(BoundedProcessGenerator::Regulate(6.0, -5.0, 5.0, BoundaryScheme::REGULATED) == 5.0);
	REQUIRE(BoundedProcessGenerator::Regulate(-42.0, -5.0, 5.0, BoundaryScheme::REGULATED) == -5.0);
}

TEST_CASE("Regulate: Reflection mirrors about the violated bound", "[simulation][boundary]") {
	using Catch::Matchers::WithinAbs;
	REQUIRE_THAT(BoundedProcessGenerator::Regulate(6.0, -5.0, 5.0, BoundaryScheme::REFLECTING), WithinAbs(4.0, 1e-12));
	REQUIRE_THAT(BoundedProcessGenerator::Regulate(-7.0, -5.0, 5.0, BoundaryScheme::REFLECTING),
	             WithinAbs(-3.0, 1e-12));
	// Overshoot beyond the full width bounces off both bounds
	REQUIRE_THAT(BoundedProcessGenerator::Regulate(17.0, -5.0, 5.0, BoundaryScheme::REFLECTING),
	             WithinAbs(-3.0, 1e-12));
}

TEST_CASE("Bounded AR(1): Length and bounds", "[simulation][ar1]") {
	std::mt19937_64 rng(42);
	GeneratorOptions options;
	options.n_obs = 100;
	options.bounds = Bounds(-5.0, 5.0);
	options.rho = 1.0;
	options.sigma = 1.0;
	options.burnin = 50;

	SECTION("Regulated") {
		auto series = BoundedProcessGenerator::GenerateBoundedAR1(options, rng);
		REQUIRE(series.size() == 100);
		REQUIRE(series.minCoeff() >= -5.0);
		REQUIRE(series.maxCoeff() <= 5.0);
	}

	SECTION("Reflecting with large innovations") {
		options.scheme = BoundaryScheme::REFLECTING;
		options.sigma = 20.0;
		auto series = BoundedProcessGenerator::GenerateBoundedAR1(options, rng);
		REQUIRE(series.size() == 100);
		REQUIRE(series.minCoeff() >= -5.0);
		REQUIRE(series.maxCoeff() <= 5.0);
	}

	SECTION("Tight bounds are hit") {
		options.bounds = Bounds(-0.5, 0.5);
		options.n_obs = 500;
		auto series = BoundedProcessGenerator::GenerateBoundedAR1(options, rng);
		REQUIRE(series.minCoeff() == -0.5);
		REQUIRE(series.maxCoeff() == 0.5);
	}
}

TEST_CASE("Bounded AR(1): Fixed seed reproduces the series", "[simulation][ar1]") {
	GeneratorOptions options;
	options.burnin = 10;

	std::mt19937_64 rng_a(7);
	std::mt19937_64 rng_b(7);
	std::mt19937_64 rng_c(8);
	auto a = BoundedProcessGenerator::GenerateBoundedAR1(options, rng_a);
	auto b = BoundedProcessGenerator::GenerateBoundedAR1(options, rng_b);
	auto c = BoundedProcessGenerator::GenerateBoundedAR1(options, rng_c);

	REQUIRE(a == b);
	REQUIRE(a != c);
}

TEST_CASE("Bounded AR(1): Burn-in drops the leading values", "[simulation][ar1]") {
	GeneratorOptions full;
	full.n_obs = 60;

	GeneratorOptions trimmed = full;
	trimmed.n_obs = 40;
	trimmed.burnin = 20;

	std::mt19937_64 rng_a(123);
	std::mt19937_64 rng_b(123);
	auto a = BoundedProcessGenerator::GenerateBoundedAR1(full, rng_a);
	auto b = BoundedProcessGenerator::GenerateBoundedAR1(trimmed, rng_b);

	REQUIRE(b.size() == 40);
	REQUIRE(a.tail(40) == b);
}

TEST_CASE("Bounded AR(1): White noise around the midpoint", "[simulation][ar1]") {
	std::mt19937_64 rng(2024);
	GeneratorOptions options;
	options.n_obs = 5000;
	options.bounds = Bounds(-90.0, 110.0);
	options.rho = 0.0;

	auto series = BoundedProcessGenerator::GenerateBoundedAR1(options, rng);
	const double mean = series.mean();
	const double variance = (series.array() - mean).square().sum() / static_cast<double>(series.size() - 1);

	REQUIRE_THAT(mean, Catch::Matchers::WithinAbs(10.0, 0.1));
	REQUIRE_THAT(variance, Catch::Matchers::WithinAbs(1.0, 0.1));
}

TEST_CASE("Bounded AR(1): Validation", "[simulation][validation]") {
	std::mt19937_64 rng(1);
	GeneratorOptions options;

	SECTION("Explosive rho") {
		options.rho = 1.01;
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateBoundedAR1(options, rng), std::invalid_argument);
	}

	SECTION("Non-positive sigma") {
		options.sigma = 0.0;
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateBoundedAR1(options, rng), std::invalid_argument);
	}

	SECTION("Empty series") {
		options.n_obs = 0;
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateBoundedAR1(options, rng), std::invalid_argument);
	}

	SECTION("Inverted bounds") {
		options.bounds = Bounds(5.0, -5.0);
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateBoundedAR1(options, rng), std::invalid_argument);
	}

	SECTION("Start outside the bounds") {
		options.initial_value = 6.0;
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateBoundedAR1(options, rng), std::invalid_argument);
	}
}

TEST_CASE("Regulated OU: Bounds and mean reversion", "[simulation][ou]") {
	std::mt19937_64 rng(99);

	SECTION("Regulated Brownian motion stays inside") {
		auto path = BoundedProcessGenerator::GenerateRegulatedOU(1000, Bounds(-1.0, 1.0), 0.0, 0.0, 1.0, 0.1, 0.0, rng);
		REQUIRE(path.size() == 1000);
		REQUIRE(path.minCoeff() >= -1.0);
		REQUIRE(path.maxCoeff() <= 1.0);
	}

	SECTION("Strong mean reversion settles at mu") {
		auto path = BoundedProcessGenerator::GenerateRegulatedOU(2000, Bounds(-10.0, 10.0), 5.0, 2.0, 0.1, 0.01, 0.0, rng);
		REQUIRE_THAT(path.tail(1000).mean(), Catch::Matchers::WithinAbs(2.0, 0.05));
	}

	SECTION("Validation") {
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateRegulatedOU(10, Bounds(-1.0, 1.0), -1.0, 0.0, 1.0, 0.1, 0.0, rng),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateRegulatedOU(10, Bounds(-1.0, 1.0), 1.0, 0.0, 1.0, 0.0, 0.0, rng),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateRegulatedOU(10, Bounds(-1.0, 1.0), 1.0, 0.0, 1.0, 0.1, 2.0, rng),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(BoundedProcessGenerator::GenerateRegulatedOU(0, Bounds(-1.0, 1.0), 1.0, 0.0, 1.0, 0.1, 0.0, rng),
		                  std::invalid_argument);
	}
}

TEST_CASE("Regulated random walk: Fills the path inside the bounds", "[simulation][null]") {
	std::mt19937_64 rng(5);
	Eigen::VectorXd path(400);

	BoundedProcessGenerator::FillRegulatedRandomWalk(-2.0, 3.0, rng, path);
	REQUIRE(path.minCoeff() >= -2.0);
	REQUIRE(path.maxCoeff() <= 3.0);
	REQUIRE(path.minCoeff() == -2.0);

	REQUIRE_THROWS_AS(BoundedProcessGenerator::FillRegulatedRandomWalk(0.5, 3.0, rng, path), std::invalid_argument);
	REQUIRE_THROWS_AS(BoundedProcessGenerator::FillRegulatedRandomWalk(-3.0, -0.5, rng, path), std::invalid_argument);
}
