#include <catch2/catch_test_macros.hpp>

#include "demand-cast/utils/logging.hpp"

#include <spdlog/spdlog.h>

using demandcast::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "demand-cast");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging macros route through the shared logger", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	const auto first_level = logger->level();
	logger->set_level(spdlog::level::off);

	REQUIRE_NOTHROW(DEMANDCAST_INFO("forecast for {} days", 30));
	REQUIRE_NOTHROW(DEMANDCAST_WARN("fallback {}", "taken"));

	logger->set_level(first_level);
}
