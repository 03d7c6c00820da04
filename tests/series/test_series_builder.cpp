#include <catch2/catch_test_macros.hpp>

#include "demand-cast/core/errors.hpp"
#include "demand-cast/series/series_builder.hpp"

#include <utility>
#include <vector>

using demandcast::core::CalendarDate;
using demandcast::core::InvalidRangeError;
using demandcast::core::MalformedSeriesError;
using demandcast::series::DemandEvent;
using demandcast::series::SeriesBuilder;

TEST_CASE("SeriesBuilder sums outgoing movements per day", "[series][builder]") {
	const SeriesBuilder builder;
	const CalendarDate start(2025, 6, 2);
	const std::vector<DemandEvent> events{
	    {start, -3.0},
	    {start, -2.0},
	    {start, 10.0}, // restock, not demand
	    {start.addDays(2), -4.0},
	};

	const auto series = builder.build(events, start, start.addDays(3));
	REQUIRE(series.size() == 4);
	REQUIRE(series.isContiguous());
	REQUIRE(series.values() == std::vector<double>{5.0, 0.0, 4.0, 0.0});
	REQUIRE(series[0].day_of_week == 1);
	REQUIRE_FALSE(series[0].is_weekend);
}

TEST_CASE("SeriesBuilder ignores events outside the range", "[series][builder]") {
	const SeriesBuilder builder;
	const CalendarDate start(2025, 6, 2);
	const std::vector<DemandEvent> events{{start.addDays(-1), -9.0}, {start, -1.0}, {start.addDays(5), -9.0}};

	const auto series = builder.build(events, start, start.addDays(1));
	REQUIRE(series.values() == std::vector<double>{1.0, 0.0});
}

TEST_CASE("SeriesBuilder marks weekends and holidays", "[series][builder]") {
	const SeriesBuilder builder;
	const auto series = builder.build({}, CalendarDate(2025, 12, 24), CalendarDate(2025, 12, 28));
	REQUIRE(series.size() == 5);
	REQUIRE(series[1].date == CalendarDate(2025, 12, 25));
	REQUIRE(series[1].is_holiday);
	REQUIRE_FALSE(series[0].is_holiday);
	REQUIRE(series[3].is_weekend); // Saturday 27th
	REQUIRE(series[4].is_weekend);
}

TEST_CASE("SeriesBuilder handles a single-day range", "[series][builder]") {
	const SeriesBuilder builder;
	const CalendarDate day(2025, 1, 15);
	const auto series = builder.build({{day, -7.0}}, day, day);
	REQUIRE(series.size() == 1);
	REQUIRE(series[0].value == 7.0);
}

TEST_CASE("SeriesBuilder rejects an inverted range", "[series][builder][errors]") {
	const SeriesBuilder builder;
	REQUIRE_THROWS_AS(builder.build({}, CalendarDate(2025, 1, 2), CalendarDate(2025, 1, 1)), InvalidRangeError);
}

TEST_CASE("SeriesBuilder zero-fills pre-aggregated totals", "[series][builder]") {
	const SeriesBuilder builder;
	const std::vector<std::pair<CalendarDate, double>> totals{
	    {CalendarDate(2025, 1, 1), 4.0},
	    {CalendarDate(2025, 1, 4), 6.0},
	};
	const auto series = builder.fromDailyTotals(totals);
	REQUIRE(series.size() == 4);
	REQUIRE(series.values() == std::vector<double>{4.0, 0.0, 0.0, 6.0});
	REQUIRE(series[0].is_holiday); // New Year

	REQUIRE(builder.fromDailyTotals({}).empty());
}

TEST_CASE("SeriesBuilder rejects malformed totals", "[series][builder][errors]") {
	const SeriesBuilder builder;
	const CalendarDate day(2025, 1, 1);

	const std::vector<std::pair<CalendarDate, double>> duplicate{{day, 1.0}, {day, 2.0}};
	REQUIRE_THROWS_AS(builder.fromDailyTotals(duplicate), MalformedSeriesError);

	const std::vector<std::pair<CalendarDate, double>> backwards{{day.addDays(1), 1.0}, {day, 2.0}};
	REQUIRE_THROWS_AS(builder.fromDailyTotals(backwards), MalformedSeriesError);

	const std::vector<std::pair<CalendarDate, double>> negative{{day, -1.0}};
	REQUIRE_THROWS_AS(builder.fromDailyTotals(negative), MalformedSeriesError);
}
