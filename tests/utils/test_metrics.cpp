#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "demand-cast/utils/metrics.hpp"

using demandcast::utils::Metrics;

TEST_CASE("Metrics compute basic error statistics", "[utils][metrics]") {
	const std::vector<double> actual{1.0, 2.0, 3.0};
	const std::vector<double> predicted{1.5, 2.5, 2.0};

	const double expected_mse = (0.25 + 0.25 + 1.0) / 3.0;
	REQUIRE(Metrics::mae(actual, predicted) == Catch::Approx((0.5 + 0.5 + 1.0) / 3.0));
	REQUIRE(Metrics::mse(actual, predicted) == Catch::Approx(expected_mse));
	REQUIRE(Metrics::rmse(actual, predicted) == Catch::Approx(std::sqrt(expected_mse)));

	const auto mape = Metrics::mape(actual, predicted);
	REQUIRE(mape.has_value());
	const double expected_mape = ((0.5 / 1.0) + (0.5 / 2.0) + (1.0 / 3.0)) / 3.0 * 100.0;
	REQUIRE(*mape == Catch::Approx(expected_mape).margin(1e-6));
}

TEST_CASE("MAPE skips zero actuals", "[utils][metrics]") {
	const std::vector<double> actual{0.0, 10.0, 0.0, 20.0};
	const std::vector<double> predicted{5.0, 12.0, 3.0, 15.0};

	const auto mape = Metrics::mape(actual, predicted);
	REQUIRE(mape.has_value());
	REQUIRE(*mape == Catch::Approx((0.2 + 0.25) / 2.0 * 100.0));

	REQUIRE_FALSE(Metrics::mape({0.0, 0.0}, {1.0, 2.0}).has_value());
}

TEST_CASE("R squared is undefined for constant actuals", "[utils][metrics]") {
	REQUIRE_FALSE(Metrics::r2({5.0, 5.0, 5.0}, {4.0, 5.0, 6.0}).has_value());

	const auto perfect = Metrics::r2({1.0, 2.0, 3.0}, {1.0, 2.0, 3.0});
	REQUIRE(perfect.has_value());
	REQUIRE(*perfect == Catch::Approx(1.0));
}

TEST_CASE("Metrics::all aggregates every statistic", "[utils][metrics]") {
	const std::vector<double> actual{2.0, 4.0, 6.0, 8.0};
	const std::vector<double> predicted{2.0, 5.0, 5.0, 8.0};

	const auto metrics = Metrics::all(actual, predicted);
	REQUIRE(metrics.n == 4);
	REQUIRE(metrics.mae == Catch::Approx(0.5));
	REQUIRE(metrics.mse == Catch::Approx(0.5));
	REQUIRE(metrics.rmse == Catch::Approx(std::sqrt(0.5)));
	REQUIRE(metrics.mape.has_value());
	REQUIRE(metrics.r_squared.has_value());
	REQUIRE(*metrics.r_squared == Catch::Approx(1.0 - 2.0 / 20.0));
}

TEST_CASE("Metrics validate input lengths", "[utils][metrics]") {
	REQUIRE_THROWS_AS(Metrics::mae({1.0, 2.0}, {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::mse({}, {}), std::invalid_argument);
}

TEST_CASE("Accuracy is one minus MAPE with a floor", "[utils][metrics]") {
	REQUIRE(Metrics::accuracy(12.0, 0.25, 0.1) == Catch::Approx(0.88));
	REQUIRE(Metrics::accuracy(std::nullopt, 0.25, 0.1) == Catch::Approx(0.75));
	REQUIRE(Metrics::accuracy(250.0, 0.25, 0.1) == 0.1);
}
