#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "demand-cast/calendar/islamic_window_table.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using Catch::Matchers::ContainsSubstring;
using demandcast::calendar::IslamicWindowTable;
using demandcast::core::CalendarDate;

TEST_CASE("Window table parses versioned CSV", "[calendar][table]") {
	std::istringstream input("# version: test-1\n"
	                         "year,ramadan_start,ramadan_end,lebaran_start,lebaran_end\n"
	                         "\n"
	                         "2025, 2025-02-28, 2025-03-29, 2025-03-30, 2025-04-05\n"
	                         "2026,2026-02-17,2026-03-18,2026-03-19,2026-03-25\n");
	const auto table = IslamicWindowTable::parse(input);

	REQUIRE(table.version() == "test-1");
	REQUIRE(table.size() == 2);
	const auto windows = table.find(2025);
	REQUIRE(windows.has_value());
	REQUIRE(windows->ramadan_start == CalendarDate(2025, 2, 28));
	REQUIRE(windows->lebaran_end == CalendarDate(2025, 4, 5));
	REQUIRE_FALSE(table.find(2030).has_value());
}

namespace {

IslamicWindowTable shippedTable() {
	return IslamicWindowTable::fromFile(std::string(DEMANDCAST_TEST_DATA_DIR) + "/islamic_windows.csv");
}

} // namespace

TEST_CASE("Default window table is empty", "[calendar][table]") {
	const IslamicWindowTable table;
	REQUIRE(table.empty());
	REQUIRE(table.version().empty());
	REQUIRE_FALSE(table.find(2025).has_value());
	REQUIRE_FALSE(table.ramadanContaining(CalendarDate(2025, 3, 10)).has_value());
}

TEST_CASE("Window table finds the window containing a date", "[calendar][table]") {
	const auto table = shippedTable();
	REQUIRE(table.ramadanContaining(CalendarDate(2026, 3, 1)).has_value());
	REQUIRE(table.lebaranContaining(CalendarDate(2025, 4, 1)).has_value());
	REQUIRE_FALSE(table.ramadanContaining(CalendarDate(2025, 6, 1)).has_value());
	REQUIRE_FALSE(table.lebaranContaining(CalendarDate(2025, 3, 15)).has_value());
}

TEST_CASE("Window table reports malformed lines", "[calendar][table][errors]") {
	SECTION("wrong column count") {
		std::istringstream input("year,ramadan_start,ramadan_end,lebaran_start,lebaran_end\n"
		                         "2025,2025-02-28,2025-03-29,2025-03-30\n");
		REQUIRE_THROWS_WITH(IslamicWindowTable::parse(input), ContainsSubstring("line 2"));
	}
	SECTION("bad date") {
		std::istringstream input("2025,2025-02-28,2025-03-29,2025-03-30,2025-04-5x\n");
		REQUIRE_THROWS_AS(IslamicWindowTable::parse(input), std::invalid_argument);
	}
	SECTION("bad year") {
		std::istringstream input("# version: 1\n20x5,2025-02-28,2025-03-29,2025-03-30,2025-04-05\n");
		REQUIRE_THROWS_WITH(IslamicWindowTable::parse(input), ContainsSubstring("line 2"));
	}
	SECTION("window ends before it starts") {
		std::istringstream input("2025,2025-03-29,2025-02-28,2025-03-30,2025-04-05\n");
		REQUIRE_THROWS_AS(IslamicWindowTable::parse(input), std::invalid_argument);
	}
}

TEST_CASE("Window table loads the shipped data file", "[calendar][table]") {
	const auto table = shippedTable();
	REQUIRE(table.version() == "2025.1");
	REQUIRE(table.size() == 7);

	const auto windows = table.find(2026);
	REQUIRE(windows.has_value());
	REQUIRE(windows->ramadan_start == CalendarDate(2026, 2, 17));
	REQUIRE(windows->ramadan_end == CalendarDate(2026, 3, 18));
	REQUIRE(windows->lebaran_start == CalendarDate(2026, 3, 19));
	REQUIRE(windows->lebaran_end == CalendarDate(2026, 3, 25));

	REQUIRE_THROWS_AS(IslamicWindowTable::fromFile("/nonexistent/islamic_windows.csv"), std::runtime_error);
}
