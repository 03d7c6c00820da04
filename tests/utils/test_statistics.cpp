#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-cast/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace stats = demandcast::utils::stats;

TEST_CASE("Descriptive statistics use the population convention", "[utils][statistics]") {
	const std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
	REQUIRE(stats::mean(values) == Catch::Approx(5.0));
	REQUIRE(stats::variance(values) == Catch::Approx(4.0));
	REQUIRE(stats::stdDev(values) == Catch::Approx(2.0));

	REQUIRE(stats::mean({}) == 0.0);
	REQUIRE(stats::stdDev({}) == 0.0);
}

TEST_CASE("Autocorrelation peaks at the pattern period", "[utils][statistics]") {
	std::vector<double> values;
	for (int cycle = 0; cycle < 8; ++cycle) {
		for (double v : {10.0, 12.0, 14.0, 30.0, 14.0, 12.0, 10.0}) {
			values.push_back(v);
		}
	}
	const double at_period = stats::autocorrelation(values, 7);
	REQUIRE(at_period == Catch::Approx(49.0 / 56.0).margin(1e-9));
	REQUIRE(at_period > std::abs(stats::autocorrelation(values, 3)));

	REQUIRE(stats::autocorrelation(std::vector<double>(20, 3.0), 7) == 0.0);
	REQUIRE(stats::autocorrelation({1.0, 2.0}, 5) == 0.0);
}

TEST_CASE("Error function approximation matches reference values", "[utils][statistics]") {
	REQUIRE(stats::erf(0.0) == Catch::Approx(0.0).margin(1e-7));
	REQUIRE(stats::erf(0.5) == Catch::Approx(0.5204998778).margin(1e-6));
	REQUIRE(stats::erf(1.0) == Catch::Approx(0.8427007929).margin(1e-6));
	REQUIRE(stats::erf(-1.0) == Catch::Approx(-0.8427007929).margin(1e-6));

	REQUIRE(stats::normalCdf(0.0) == Catch::Approx(0.5).margin(1e-7));
	REQUIRE(stats::normalCdf(1.959964) == Catch::Approx(0.975).margin(1e-6));
}

TEST_CASE("Normal quantile inverts the CDF", "[utils][statistics]") {
	REQUIRE(stats::normalQuantile(0.5) == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(stats::normalQuantile(0.975) == Catch::Approx(1.959964).margin(1e-5));
	REQUIRE(stats::normalQuantile(0.025) == Catch::Approx(-1.959964).margin(1e-5));
	REQUIRE(stats::normalQuantile(0.995) == Catch::Approx(2.575829).margin(1e-5));
	REQUIRE(stats::normalQuantile(0.01) == Catch::Approx(-2.326348).margin(1e-5));

	REQUIRE_THROWS_AS(stats::normalQuantile(0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(stats::normalQuantile(1.0), std::invalid_argument);
}
