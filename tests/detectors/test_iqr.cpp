#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "demand-cast/detectors/iqr.hpp"

#include <random>
#include <stdexcept>
#include <vector>

using demandcast::detectors::IQRDetectorBuilder;

TEST_CASE("IQR builder validates parameters", "[detectors][iqr][builder]") {
	REQUIRE_THROWS_AS(IQRDetectorBuilder().withMultiplier(-1.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(IQRDetectorBuilder().minSamples(0).build(), std::invalid_argument);
	REQUIRE(IQRDetectorBuilder().build()->getName() == "IQRDetector");
}

TEST_CASE("IQR quartiles use floor positions of the sorted values", "[detectors][iqr]") {
	// Sorted: 1 2 3 4 5 6 7 100 -> Q1 = sorted[2] = 3, Q3 = sorted[6] = 7, fences [-3, 13].
	const auto series = tests::helpers::makeDailySeries({5.0, 1.0, 100.0, 3.0, 2.0, 7.0, 4.0, 6.0});
	const auto detector = IQRDetectorBuilder().build();

	const auto result = detector->detect(series);
	REQUIRE(result.lower_fence == -3.0);
	REQUIRE(result.upper_fence == 13.0);
	REQUIRE(result.outlier_indices == std::vector<std::size_t>{2});

	const auto cleaned = detector->filter(series);
	REQUIRE(cleaned.size() == 7);
	REQUIRE(cleaned.values() == std::vector<double>{5.0, 1.0, 3.0, 2.0, 7.0, 4.0, 6.0});
	REQUIRE(cleaned[2].date == series[3].date);
}

TEST_CASE("IQR filter passes short series through", "[detectors][iqr]") {
	const auto series = tests::helpers::makeDailySeries({1.0, 1000.0, 1.0});
	const auto detector = IQRDetectorBuilder().build();
	REQUIRE(detector->filter(series) == series);
	REQUIRE(detector->filter(tests::helpers::makeDailySeries({})).empty());
}

TEST_CASE("IQR filter is idempotent", "[detectors][iqr][property]") {
	const auto detector = IQRDetectorBuilder().build();

	SECTION("constant series") {
		const auto series = tests::helpers::makeDailySeries(tests::helpers::constantValues(10.0, 30));
		const auto once = detector->filter(series);
		REQUIRE(once == series);
		REQUIRE(detector->filter(once) == once);
	}
	SECTION("series with a single spike") {
		auto values = tests::helpers::constantValues(10.0, 30);
		values[20] = 100.0;
		const auto once = detector->filter(tests::helpers::makeDailySeries(values));
		REQUIRE(once.size() == 29);
		REQUIRE(detector->filter(once) == once);
	}
	SECTION("weekly pattern") {
		const auto values = tests::helpers::repeatPattern({10.0, 12.0, 14.0, 16.0, 18.0, 25.0, 30.0}, 6);
		const auto once = detector->filter(tests::helpers::makeDailySeries(values));
		REQUIRE(detector->filter(once) == once);
	}
}

TEST_CASE("Default filter removes points exposed by the first pass", "[detectors][iqr][property]") {
	// Pass 1: fences [1.5, 21.5] drop 1. Pass 2 on {13, 9, 14, 14}: fences [11.5, 15.5] drop 9.
	const auto series = tests::helpers::makeDailySeries({13.0, 9.0, 14.0, 14.0, 1.0});

	const auto single = IQRDetectorBuilder().untilStable(false).build();
	REQUIRE(single->filter(series).size() == 4);

	const auto detector = IQRDetectorBuilder().build();
	const auto cleaned = detector->filter(series);
	REQUIRE(cleaned.values() == std::vector<double>{13.0, 14.0, 14.0});
	REQUIRE(cleaned[0].date == series[0].date);
	REQUIRE(detector->filter(cleaned) == cleaned);
}

TEST_CASE("Default filter is idempotent on random series", "[detectors][iqr][property]") {
	const auto detector = IQRDetectorBuilder().build();
	std::mt19937 rng(7);
	std::uniform_int_distribution<int> length(0, 40);
	std::uniform_int_distribution<int> value(0, 30);
	std::uniform_int_distribution<int> spike(0, 9);

	for (int trial = 0; trial < 2000; ++trial) {
		std::vector<double> values(static_cast<std::size_t>(length(rng)));
		for (auto &v : values) {
			v = static_cast<double>(value(rng));
			if (spike(rng) == 0) {
				v *= 20.0;
			}
		}
		const auto once = detector->filter(tests::helpers::makeDailySeries(values));
		const auto twice = detector->filter(once);
		REQUIRE(twice == once);
	}
}

TEST_CASE("Until-stable mode reaches a fixed point", "[detectors][iqr][property]") {
	const std::vector<double> values{10.0, 11.0, 9.0, 10.0, 12.0, 10.0, 11.0, 9.0, 20.0, 1000.0};
	const auto series = tests::helpers::makeDailySeries(values);

	const auto single = IQRDetectorBuilder().untilStable(false).build();
	const auto stable = IQRDetectorBuilder().untilStable().build();

	const auto once = single->filter(series);
	const auto fixed = stable->filter(series);
	REQUIRE(fixed.size() <= once.size());
	REQUIRE(stable->filter(fixed) == fixed);
	REQUIRE(single->detect(fixed).outlier_indices.empty());
}
