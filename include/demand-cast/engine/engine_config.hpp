#pragma once

#include "demand-cast/calendar/calendar_effects.hpp"
#include "demand-cast/detectors/anomaly_detector.hpp"
#include "demand-cast/evaluation/backtester.hpp"
#include "demand-cast/models/holt_winters.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace demandcast::engine {

/**
 * @struct EngineConfig
 * @brief Every tunable of the forecasting and anomaly pipeline.
 */
struct EngineConfig {
	/// Days to forecast. Also the size of each backtest window.
	int horizon = 30;
	double confidence_level = 0.95;
	double interval_widening = 0.5;

	models::HoltWintersConfig holt_winters;
	calendar::CalendarConfig calendar;
	detectors::AnomalyConfig anomaly;
	/// horizon is taken from EngineConfig::horizon.
	evaluation::BacktestConfig backtest;

	double outlier_multiplier = 1.5;
	std::size_t outlier_min_samples = 4;
	bool outlier_until_stable = true;

	std::size_t trend_min_samples = 7;
	double trend_significance = 0.05;
	/// Trend influence decays as exp(-trend_decay * day).
	double trend_decay = 0.02;

	std::size_t decomposition_window = 7;
	double decomposition_alpha = 0.3;
	std::size_t decomposition_min_samples = 14;
	double default_baseline = 10.0;

	std::vector<std::uint32_t> candidate_periods = {7, 14, 30};
	double seasonality_threshold = 0.3;
	std::size_t seasonality_min_samples = 14;

	/// Relative demand by day of week, Sunday first.
	std::array<double, 7> weekday_profile = {1.0, 0.8, 0.9, 1.1, 1.2, 1.3, 1.1};
	/// Weight of the learned day-of-week index against weekday_profile.
	double learned_seasonal_weight = 0.5;

	/// Run anomaly detection on the outlier-filtered series instead of the raw one.
	bool anomaly_on_cleaned = false;

	/**
	 * @throws std::invalid_argument On the first out-of-range field.
	 */
	void validate() const;
};

} // namespace demandcast::engine
