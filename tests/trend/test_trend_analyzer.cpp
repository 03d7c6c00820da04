#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "demand-cast/trend/trend_analyzer.hpp"

#include <stdexcept>

using demandcast::core::DataStatus;
using demandcast::trend::TrendAnalyzer;
using demandcast::trend::TrendDirection;

TEST_CASE("TrendAnalyzer detects a clean upward trend", "[trend][analyzer]") {
	const auto analyzer = TrendAnalyzer::builder().build();
	const auto series = tests::helpers::makeDailySeries(tests::helpers::linearValues(5.0, 1.0, 20));

	const auto result = analyzer.analyze(series);
	REQUIRE(result.status == DataStatus::Sufficient);
	REQUIRE(result.direction == TrendDirection::Increasing);
	REQUIRE(result.slope == Catch::Approx(1.0));
	REQUIRE(result.intercept == Catch::Approx(5.0));
	REQUIRE(result.r_squared == Catch::Approx(1.0));
	REQUIRE(result.p_value < 0.001);
	REQUIRE(result.confidence > 0.99);
}

TEST_CASE("TrendAnalyzer detects a downward trend", "[trend][analyzer]") {
	const auto analyzer = TrendAnalyzer::builder().build();
	const auto result = analyzer.analyze(tests::helpers::linearValues(100.0, -2.5, 30));
	REQUIRE(result.direction == TrendDirection::Decreasing);
	REQUIRE(result.slope == Catch::Approx(-2.5));
}

TEST_CASE("TrendAnalyzer reports constant demand as stable", "[trend][analyzer]") {
	const auto analyzer = TrendAnalyzer::builder().build();
	const auto result = analyzer.analyze(tests::helpers::constantValues(10.0, 14));

	REQUIRE(result.status == DataStatus::Sufficient);
	REQUIRE(result.direction == TrendDirection::Stable);
	REQUIRE(result.slope == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(result.r_squared == 0.0);
	REQUIRE(result.p_value == Catch::Approx(1.0).margin(1e-6));
	REQUIRE(result.confidence == Catch::Approx(0.0).margin(1e-9));
}

TEST_CASE("TrendAnalyzer ignores a slope that is not significant", "[trend][analyzer]") {
	const auto analyzer = TrendAnalyzer::builder().build();
	// Alternating values have a tiny positive slope but no monotonic trend.
	const auto result = analyzer.analyze(std::vector<double>{10.0, 12.0, 10.0, 12.0, 10.0, 12.0, 10.0, 12.0});
	REQUIRE(result.slope > 0.0);
	REQUIRE(result.p_value > 0.05);
	REQUIRE(result.direction == TrendDirection::Stable);
}

TEST_CASE("TrendAnalyzer falls back below the minimum sample count", "[trend][analyzer]") {
	const auto analyzer = TrendAnalyzer::builder().minSamples(7).build();
	const auto result = analyzer.analyze(std::vector<double>{4.0, 8.0});

	REQUIRE(result.status == DataStatus::InsufficientData);
	REQUIRE(result.direction == TrendDirection::Stable);
	REQUIRE(result.slope == 0.0);
	REQUIRE(result.intercept == Catch::Approx(6.0));
	REQUIRE(result.confidence == 0.0);

	REQUIRE(analyzer.analyze(tests::helpers::makeDailySeries({})).status == DataStatus::InsufficientData);
}

TEST_CASE("Mann-Kendall statistic", "[trend][mann-kendall]") {
	const auto mk = TrendAnalyzer::mannKendall({1.0, 2.0, 3.0});
	REQUIRE(mk.s == 3.0);
	REQUIRE(mk.variance == Catch::Approx(3.0 * 2.0 * 11.0 / 18.0));
	REQUIRE(mk.z > 0.0);

	const auto mixed = TrendAnalyzer::mannKendall({3.0, 1.0, 2.0});
	REQUIRE(mixed.s == -1.0);

	const auto single = TrendAnalyzer::mannKendall({1.0});
	REQUIRE(single.p_value == 1.0);
}

TEST_CASE("TrendAnalyzer builder validates its parameters", "[trend][builder]") {
	REQUIRE_THROWS_AS(TrendAnalyzer::builder().minSamples(2).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(TrendAnalyzer::builder().significance(0.0).build(), std::invalid_argument);
	REQUIRE(TrendAnalyzer::builder().build().minSamples() == 3);
	REQUIRE(toString(TrendDirection::Increasing) == "increasing");
	REQUIRE(toString(TrendDirection::Stable) == "stable");
}
