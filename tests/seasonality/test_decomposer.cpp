#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "demand-cast/seasonality/decomposer.hpp"

#include <stdexcept>

using demandcast::core::DataStatus;
using demandcast::seasonality::SeasonalDecomposer;

TEST_CASE("Decomposition of constant demand has no seasonality", "[seasonality][decomposer]") {
	const auto decomposer = SeasonalDecomposer::builder().build();
	const auto result = decomposer.decompose(tests::helpers::makeDailySeries(tests::helpers::constantValues(10.0, 14)));

	REQUIRE(result.status == DataStatus::Sufficient);
	REQUIRE(result.baseline == Catch::Approx(10.0));
	REQUIRE(result.seasonality_strength == 0.0);
	for (double s : result.seasonal) {
		REQUIRE(s == Catch::Approx(0.0).margin(1e-9));
	}
	for (double t : result.trend) {
		REQUIRE(t == Catch::Approx(10.0));
	}
}

TEST_CASE("Decomposition is additive", "[seasonality][decomposer]") {
	const auto values = tests::helpers::repeatPattern({10.0, 12.0, 11.0, 13.0, 15.0, 25.0, 30.0}, 8);
	const auto series = tests::helpers::makeDailySeries(values);
	const auto result = SeasonalDecomposer::builder().build().decompose(series);

	REQUIRE(result.trend.size() == values.size());
	REQUIRE(result.seasonal.size() == values.size());
	REQUIRE(result.residual.size() == values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		REQUIRE(result.trend[i] + result.seasonal[i] + result.residual[i] == Catch::Approx(values[i]));
	}
}

TEST_CASE("Decomposition picks up a weekend peak", "[seasonality][decomposer]") {
	// Starts on a Monday, so the 6th and 7th values fall on Saturday and Sunday.
	const auto values = tests::helpers::repeatPattern({10.0, 10.0, 10.0, 10.0, 10.0, 30.0, 30.0}, 8);
	const auto result = SeasonalDecomposer::builder().build().decompose(tests::helpers::makeDailySeries(values));

	REQUIRE(result.seasonality_strength > 0.3);
	REQUIRE(result.seasonality_strength <= 1.0);
	REQUIRE(result.seasonal_index[6] > result.seasonal_index[3]);
	REQUIRE(result.seasonal_index[0] > result.seasonal_index[3]);
}

TEST_CASE("Short series get a flat trend", "[seasonality][decomposer]") {
	const auto result =
	    SeasonalDecomposer::builder().build().decompose(tests::helpers::makeDailySeries({2.0, 4.0, 6.0}));

	REQUIRE(result.status == DataStatus::InsufficientData);
	REQUIRE(result.baseline == Catch::Approx(4.0));
	REQUIRE(result.trend == std::vector<double>{4.0, 4.0, 4.0});
	REQUIRE(result.seasonal == std::vector<double>{0.0, 0.0, 0.0});
	REQUIRE(result.residual == std::vector<double>{-2.0, 0.0, 2.0});
	REQUIRE(result.seasonality_strength == 0.0);
}

TEST_CASE("Empty series fall back to the default baseline", "[seasonality][decomposer]") {
	const auto result = SeasonalDecomposer::builder().build().decompose(tests::helpers::makeDailySeries({}));
	REQUIRE(result.status == DataStatus::InsufficientData);
	REQUIRE(result.baseline == 10.0);
	REQUIRE(result.trend.empty());

	const auto custom = SeasonalDecomposer::builder().defaultBaseline(3.0).build();
	REQUIRE(custom.decompose(tests::helpers::makeDailySeries({})).baseline == 3.0);
}

TEST_CASE("Decomposer builder validates its parameters", "[seasonality][decomposer][builder]") {
	REQUIRE_THROWS_AS(SeasonalDecomposer::builder().window(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalDecomposer::builder().alpha(1.5).build(), std::invalid_argument);
}
