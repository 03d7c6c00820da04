#pragma once

#include "demand-cast/calendar/calendar_effects.hpp"
#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/detectors/anomaly_detector.hpp"
#include "demand-cast/detectors/iqr.hpp"
#include "demand-cast/engine/engine_config.hpp"
#include "demand-cast/evaluation/backtester.hpp"
#include "demand-cast/evaluation/confidence_interval.hpp"
#include "demand-cast/seasonality/decomposer.hpp"
#include "demand-cast/seasonality/detector.hpp"
#include "demand-cast/series/series_builder.hpp"
#include "demand-cast/trend/trend_analyzer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace demandcast::engine {

struct ForecastPoint {
	core::CalendarDate date;
	std::uint64_t predicted_demand = 0;
	evaluation::Interval confidence_interval;
	double trend_component = 0.0;
	double seasonal_component = 0.0;
	double residual_component = 0.0;
	/// Holt-Winters value before any adjustment; the default baseline for an empty history.
	double base_value = 0.0;
	/// Product of the Islamic, business-cycle and weekend/holiday multipliers.
	double calendar_multiplier = 1.0;
};

struct DayDemand {
	core::CalendarDate date;
	std::uint64_t demand = 0;
};

struct ForecastInsights {
	double total_predicted_demand = 0.0;
	double average_daily_demand = 0.0;
	/// Population standard deviation of the predictions.
	double demand_volatility = 0.0;
	std::vector<DayDemand> peak_days; ///< Highest three, descending.
	std::vector<DayDemand> low_days;  ///< Lowest three, ascending.
};

struct ForecastResult {
	core::ProductInfo product;
	std::vector<ForecastPoint> forecast_data;
	double accuracy = 0.0;
	trend::TrendResult trend;
	seasonality::SeasonalityResult seasonality;
	evaluation::BacktestResult backtesting;
	std::size_t outliers_removed = 0;
	ForecastInsights insights;
	std::chrono::system_clock::time_point generated_at;
	/// InsufficientData when any stage took its fallback.
	core::DataStatus status = core::DataStatus::InsufficientData;
};

/**
 * @class ForecastOrchestrator
 * @brief Runs the whole pipeline for one product.
 *
 * Series building, outlier removal, trend, decomposition, seasonality, backtesting and the
 * Holt-Winters base curve feed a per-day combination:
 *   base * (1 + trend) * (1 + seasonal) * islamic * business cycle * weekend/holiday,
 * floored at zero and rounded, with confidence bands around the result.
 *
 * The orchestrator holds only immutable configuration and can be shared across threads.
 */
class ForecastOrchestrator {
public:
	/**
	 * @throws std::invalid_argument If @p config fails validation.
	 */
	explicit ForecastOrchestrator(EngineConfig config = {},
	                              calendar::IslamicWindowTable window_table = calendar::IslamicWindowTable());

	/**
	 * @brief Builds the daily series from @p events over [start, end] and forecasts the days after @p end.
	 * @throws core::InvalidRangeError If start > end.
	 */
	ForecastResult forecast(const std::vector<series::DemandEvent> &events, const core::CalendarDate &start,
	                        const core::CalendarDate &end, const core::ProductInfo &product = {}) const;

	/**
	 * @brief Forecasts from an existing series.
	 *
	 * The forecast starts at @p forecast_start, or the day after the last observation. An empty
	 * history without a start date forecasts from tomorrow.
	 */
	ForecastResult forecast(const core::DemandSeries &history, const core::ProductInfo &product = {},
	                        std::optional<core::CalendarDate> forecast_start = std::nullopt) const;

	/**
	 * @throws core::InvalidRangeError If start > end.
	 */
	detectors::AnomalyReport detectAnomalies(const std::vector<series::DemandEvent> &events,
	                                         const core::CalendarDate &start, const core::CalendarDate &end,
	                                         const core::ProductInfo &product = {}) const;

	detectors::AnomalyReport detectAnomalies(const core::DemandSeries &history,
	                                         const core::ProductInfo &product = {}) const;

	const EngineConfig &config() const {
		return config_;
	}

	const series::SeriesBuilder &seriesBuilder() const {
		return series_builder_;
	}

	const calendar::CalendarEffectCalculator &calendar() const {
		return *calendar_;
	}

private:
	double seasonalComponent(int day_of_week, const seasonality::Decomposition &decomposition,
	                         const seasonality::SeasonalityResult &seasonality) const;
	static ForecastInsights insights(const std::vector<ForecastPoint> &points);

	EngineConfig config_;
	std::shared_ptr<const calendar::CalendarEffectCalculator> calendar_;
	series::SeriesBuilder series_builder_;
	std::unique_ptr<detectors::IQRDetector> outlier_filter_;
	trend::TrendAnalyzer trend_analyzer_;
	seasonality::SeasonalDecomposer decomposer_;
	seasonality::SeasonalityDetector seasonality_detector_;
	detectors::AnomalyDetector anomaly_detector_;
	evaluation::ConfidenceIntervalEstimator interval_estimator_;
};

} // namespace demandcast::engine
