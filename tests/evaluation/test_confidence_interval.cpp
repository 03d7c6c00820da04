#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-cast/evaluation/confidence_interval.hpp"

#include <stdexcept>

using demandcast::evaluation::ConfidenceIntervalEstimator;

TEST_CASE("Confidence level maps to a normal critical value", "[evaluation][interval]") {
	REQUIRE(ConfidenceIntervalEstimator(0.95).zScore() == Catch::Approx(1.959964).epsilon(1e-6));
	REQUIRE(ConfidenceIntervalEstimator(0.80).zScore() == Catch::Approx(1.281552).epsilon(1e-6));
}

TEST_CASE("Margins widen towards the end of the horizon", "[evaluation][interval]") {
	const ConfidenceIntervalEstimator estimator;
	const double z = estimator.zScore();
	REQUIRE(estimator.margin(10.0, 0, 30) == Catch::Approx(z * 10.0));
	REQUIRE(estimator.margin(10.0, 15, 30) == Catch::Approx(z * 10.0 * 1.25));
	REQUIRE(estimator.margin(10.0, 30, 30) == Catch::Approx(z * 10.0 * 1.5));
}

TEST_CASE("Lower bound is floored at zero", "[evaluation][interval]") {
	const ConfidenceIntervalEstimator estimator;
	const auto interval = estimator.interval(5.0, 10.0, 0, 30);
	REQUIRE(interval.lower == 0.0);
	REQUIRE(interval.upper == Catch::Approx(5.0 + estimator.zScore() * 10.0));
}

TEST_CASE("Estimated intervals are ordered and non-narrowing", "[evaluation][interval][property]") {
	const ConfidenceIntervalEstimator estimator;
	const std::vector<double> history{8.0, 12.0, 9.0, 15.0, 11.0, 10.0, 13.0};
	const std::vector<double> predicted{11.0, 12.0, 10.0, 14.0, 11.0};

	const auto intervals = estimator.estimate(predicted, history);
	REQUIRE(intervals.size() == predicted.size());
	for (std::size_t i = 0; i < intervals.size(); ++i) {
		REQUIRE(intervals[i].lower >= 0.0);
		REQUIRE(intervals[i].lower <= predicted[i]);
		REQUIRE(predicted[i] <= intervals[i].upper);
		if (i > 0) {
			REQUIRE(intervals[i].width() >= intervals[i - 1].width());
		}
	}
}

TEST_CASE("Flat history gives zero-width intervals", "[evaluation][interval]") {
	const ConfidenceIntervalEstimator estimator;
	const auto intervals = estimator.estimate({7.0, 7.0}, {5.0, 5.0, 5.0});
	REQUIRE(intervals[0].lower == 7.0);
	REQUIRE(intervals[1].upper == 7.0);
	REQUIRE(estimator.estimate({}, {1.0}).empty());
}

TEST_CASE("Invalid interval parameters are rejected", "[evaluation][interval][errors]") {
	REQUIRE_THROWS_AS(ConfidenceIntervalEstimator(1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(ConfidenceIntervalEstimator(0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(ConfidenceIntervalEstimator(0.9, -0.1), std::invalid_argument);
}
