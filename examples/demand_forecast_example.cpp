#include "demand-cast/engine/forecast_orchestrator.hpp"
#include "demand-cast/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace demandcast;

namespace {

// One year of stock movements for a staple product: weekly rhythm, the Ramadan run-up,
// weekly restocks and one bulk order in August.
std::vector<series::DemandEvent> syntheticYear(const core::CalendarDate &start, const core::CalendarDate &end,
                                               const calendar::CalendarEffectCalculator &calendar) {
	static const double weekday_factor[7] = {1.3, 0.8, 0.9, 1.0, 1.0, 1.2, 1.4};
	std::mt19937 rng(42);
	std::normal_distribution<double> noise(0.0, 2.0);

	std::vector<series::DemandEvent> events;
	for (auto day = start; day <= end; day = day.addDays(1)) {
		double units = 20.0 * weekday_factor[day.dayOfWeek()] * calendar.islamicMultiplier(day) + noise(rng);
		if (day == core::CalendarDate(2024, 8, 14)) {
			units += 180.0;
		}
		events.push_back({day, -std::max(0.0, std::round(units))});
		if (day.dayOfWeek() == 1) {
			events.push_back({day, 200.0});
		}
	}
	return events;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

// Announced Ramadan/Lebaran windows. Without them only the arithmetic calendar is used.
calendar::IslamicWindowTable loadWindowTable(const std::string &path) {
	try {
		return calendar::IslamicWindowTable::fromFile(path);
	} catch (const std::exception &ex) {
		DEMANDCAST_WARN("{} Continuing without announced Islamic windows.", ex.what());
		return calendar::IslamicWindowTable();
	}
}

} // namespace

int main(int argc, char **argv) {
	utils::Logging::init(spdlog::level::warn);

	std::cout << "=== Demand Forecast Example ===\n";
	std::cout << "Staple product in a market with Ramadan and Lebaran seasonality\n";

	const std::string table_path = argc > 1 ? argv[1] : std::string(DEMANDCAST_DATA_DIR) + "/islamic_windows.csv";
	const auto window_table = loadWindowTable(table_path);
	std::cout << "Islamic windows: " << window_table.size() << " years";
	if (!window_table.version().empty()) {
		std::cout << " (version " << window_table.version() << ")";
	}
	std::cout << "\n";

	const engine::ForecastOrchestrator orchestrator(engine::EngineConfig {}, window_table);
	const core::CalendarDate start(2024, 3, 1);
	const core::CalendarDate end(2025, 2, 14);
	const core::ProductInfo product {"SKU-1001", "Premium rice 5kg", 72000.0};

	const auto events = syntheticYear(start, end, orchestrator.calendar());

	// ===================================================================
	// Scenario 1: Forecast into Ramadan 2025
	// ===================================================================
	printHeader("Scenario 1: Forecast into Ramadan");

	const auto result = orchestrator.forecast(events, start, end, product);
	std::cout << "History: " << start.toString() << " .. " << end.toString() << "\n";
	std::cout << "Outliers removed: " << result.outliers_removed << "\n";
	std::cout << "Trend: " << trend::toString(result.trend.direction) << " (slope " << std::fixed
	          << std::setprecision(3) << result.trend.slope << ")\n";
	std::cout << "Seasonality strength: " << std::setprecision(2) << result.seasonality.strength
	          << ", period " << result.seasonality.period << "\n";
	std::cout << "Backtest accuracy: " << result.accuracy * 100.0 << "%\n";
	std::cout << "Status: " << core::toString(result.status) << "\n\n";

	std::cout << "  Date       | Demand | Interval          | Calendar\n";
	std::cout << "  " << std::string(52, '-') << "\n";
	for (const auto &point : result.forecast_data) {
		std::cout << "  " << point.date.toString() << " | " << std::setw(6) << point.predicted_demand << " | ["
		          << std::setw(6) << point.confidence_interval.lower << ", " << std::setw(6)
		          << point.confidence_interval.upper << "] | x" << point.calendar_multiplier << "\n";
	}

	std::cout << "\nTotal: " << result.insights.total_predicted_demand
	          << ", average: " << result.insights.average_daily_demand << "\n";
	std::cout << "Peak days:";
	for (const auto &day : result.insights.peak_days) {
		std::cout << " " << day.date.toString() << " (" << day.demand << ")";
	}
	std::cout << "\n";
	std::cout.unsetf(std::ios::floatfield);

	// ===================================================================
	// Scenario 2: Anomalies in the history
	// ===================================================================
	printHeader("Scenario 2: Demand Anomalies");

	const auto report = orchestrator.detectAnomalies(events, start, end, product);
	std::cout << "Found " << report.summary.total << " anomalies (" << report.summary.spikes << " spikes, "
	          << report.summary.drops << " drops)\n";
	for (std::size_t i = 0; i < std::min<std::size_t>(5, report.anomalies.size()); ++i) {
		const auto &anomaly = report.anomalies[i];
		std::cout << "  " << anomaly.date.toString() << " " << std::setw(18) << std::left
		          << detectors::toString(anomaly.type) << std::right << " actual " << anomaly.actual
		          << " vs expected " << std::fixed << std::setprecision(1) << anomaly.expected << " ("
		          << detectors::AnomalyDetector::severityLevel(anomaly.severity_score) << ")\n";
		std::cout.unsetf(std::ios::floatfield);
	}
	for (const auto &pattern : report.summary.common_patterns) {
		std::cout << "  * " << pattern << "\n";
	}

	return 0;
}
