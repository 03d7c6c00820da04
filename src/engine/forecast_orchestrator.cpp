#include "demand-cast/engine/forecast_orchestrator.hpp"
#include "demand-cast/models/model_factory.hpp"
#include "demand-cast/utils/logging.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace demandcast::engine {

namespace {

EngineConfig validated(EngineConfig config) {
	config.validate();
	return config;
}

// Saturates at the largest representable demand; NaN and negatives map to 0.
std::uint64_t toDemand(double value) {
	constexpr double kCeiling = 18446744073709551616.0; // 2^64
	const double rounded = std::round(std::max(0.0, value));
	if (!(rounded < kCeiling)) {
		return std::numeric_limits<std::uint64_t>::max();
	}
	return static_cast<std::uint64_t>(rounded);
}

} // namespace

ForecastOrchestrator::ForecastOrchestrator(EngineConfig config, calendar::IslamicWindowTable window_table)
    : config_(validated(std::move(config))),
      calendar_(std::make_shared<const calendar::CalendarEffectCalculator>(config_.calendar, std::move(window_table))),
      series_builder_(calendar_),
      outlier_filter_(detectors::IQRDetectorBuilder()
                          .withMultiplier(config_.outlier_multiplier)
                          .minSamples(config_.outlier_min_samples)
                          .untilStable(config_.outlier_until_stable)
                          .build()),
      trend_analyzer_(trend::TrendAnalyzer::builder()
                          .minSamples(config_.trend_min_samples)
                          .significance(config_.trend_significance)
                          .build()),
      decomposer_(seasonality::SeasonalDecomposer::builder()
                      .window(config_.decomposition_window)
                      .alpha(config_.decomposition_alpha)
                      .minSamples(config_.decomposition_min_samples)
                      .defaultBaseline(config_.default_baseline)
                      .build()),
      seasonality_detector_(seasonality::SeasonalityDetector::builder()
                                .candidatePeriods(config_.candidate_periods)
                                .threshold(config_.seasonality_threshold)
                                .minSamples(config_.seasonality_min_samples)
                                .calendar(calendar_)
                                .build()),
      anomaly_detector_(config_.anomaly, calendar_),
      interval_estimator_(config_.confidence_level, config_.interval_widening) {
}

ForecastResult ForecastOrchestrator::forecast(const std::vector<series::DemandEvent> &events,
                                              const core::CalendarDate &start, const core::CalendarDate &end,
                                              const core::ProductInfo &product) const {
	const auto history = series_builder_.build(events, start, end);
	return forecast(history, product, end.addDays(1));
}

double ForecastOrchestrator::seasonalComponent(int day_of_week, const seasonality::Decomposition &decomposition,
                                               const seasonality::SeasonalityResult &seasonality) const {
	const auto dow = static_cast<std::size_t>(day_of_week);
	const double profile_offset = config_.weekday_profile[dow] - 1.0;

	double blended = profile_offset;
	if (decomposition.status == core::DataStatus::Sufficient && decomposition.baseline > 0.0) {
		const double learned_offset = decomposition.seasonal_index[dow] / decomposition.baseline;
		blended = (1.0 - config_.learned_seasonal_weight) * profile_offset +
		          config_.learned_seasonal_weight * learned_offset;
	}
	return seasonality.strength * blended;
}

ForecastResult ForecastOrchestrator::forecast(const core::DemandSeries &history, const core::ProductInfo &product,
                                              std::optional<core::CalendarDate> forecast_start) const {
	ForecastResult result;
	result.product = product;
	result.generated_at = std::chrono::system_clock::now();

	const auto start = forecast_start ? *forecast_start
	                                  : (history.empty() ? core::CalendarDate::today().addDays(1)
	                                                     : history.endDate()->addDays(1));

	const auto cleaned = outlier_filter_->filter(history);
	result.outliers_removed = history.size() - cleaned.size();

	result.trend = trend_analyzer_.analyze(cleaned);
	const auto decomposition = decomposer_.decompose(cleaned);
	result.seasonality = seasonality_detector_.detect(cleaned);

	auto backtest_config = config_.backtest;
	backtest_config.horizon = config_.horizon;
	const auto hw_config = config_.holt_winters;
	result.backtesting = evaluation::Backtester(backtest_config).evaluate(cleaned, [hw_config]() {
		return models::ModelFactory::create(models::ModelType::HoltWinters, hw_config);
	});
	result.accuracy = result.backtesting.accuracy;

	auto base_model = models::ModelFactory::create(models::ModelType::HoltWinters, config_.holt_winters);
	base_model->fit(cleaned);
	const auto base = base_model->predict(config_.horizon);

	const std::vector<double> cleaned_values = cleaned.values();
	const double history_mean = utils::stats::mean(cleaned_values);
	const double history_spread = utils::stats::stdDev(cleaned_values);
	const double relative_slope = history_mean > 0.0 ? result.trend.slope / history_mean : 0.0;
	const double residual_level = utils::stats::mean(decomposition.residual);

	const auto horizon = static_cast<std::size_t>(config_.horizon);
	result.forecast_data.reserve(horizon);
	for (std::size_t i = 0; i < horizon; ++i) {
		ForecastPoint point;
		point.date = start.addDays(static_cast<std::int64_t>(i));
		// Without any history the decomposition baseline stands in for the model.
		point.base_value = cleaned.empty() ? decomposition.baseline : base.point[i];

		const auto day = static_cast<double>(i);
		point.trend_component = relative_slope * day * std::exp(-config_.trend_decay * day) * result.trend.confidence;
		point.seasonal_component = seasonalComponent(point.date.dayOfWeek(), decomposition, result.seasonality);
		point.residual_component = residual_level;
		point.calendar_multiplier = calendar_->islamicMultiplier(point.date) *
		                            calendar_->businessCycleMultiplier(point.date) *
		                            calendar_->weekendHolidayMultiplier(point.date);

		const double value = point.base_value * (1.0 + point.trend_component) * (1.0 + point.seasonal_component) *
		                     point.calendar_multiplier;
		point.predicted_demand = toDemand(value);
		point.confidence_interval = interval_estimator_.interval(static_cast<double>(point.predicted_demand),
		                                                         history_spread, i, horizon);
		result.forecast_data.push_back(point);
	}

	result.insights = insights(result.forecast_data);

	const bool complete = result.trend.status == core::DataStatus::Sufficient &&
	                      decomposition.status == core::DataStatus::Sufficient &&
	                      result.seasonality.status == core::DataStatus::Sufficient &&
	                      result.backtesting.status == core::DataStatus::Sufficient;
	result.status = complete ? core::DataStatus::Sufficient : core::DataStatus::InsufficientData;

	DEMANDCAST_INFO("Forecast for '{}': {} days from {}, trend {}, seasonality {:.2f}, accuracy {:.2f} ({}).",
	                product.id.empty() ? std::string("series") : product.id, horizon, start.toString(),
	                trend::toString(result.trend.direction), result.seasonality.strength, result.accuracy,
	                core::toString(result.status));
	return result;
}

ForecastInsights ForecastOrchestrator::insights(const std::vector<ForecastPoint> &points) {
	ForecastInsights result;
	if (points.empty()) {
		return result;
	}

	std::vector<double> values;
	std::vector<DayDemand> days;
	values.reserve(points.size());
	days.reserve(points.size());
	for (const auto &point : points) {
		values.push_back(static_cast<double>(point.predicted_demand));
		days.push_back({point.date, point.predicted_demand});
	}

	result.total_predicted_demand = std::accumulate(values.begin(), values.end(), 0.0);
	result.average_daily_demand = result.total_predicted_demand / static_cast<double>(values.size());
	result.demand_volatility = utils::stats::stdDev(values);

	const std::size_t count = std::min<std::size_t>(3, days.size());
	auto by_demand = days;
	std::stable_sort(by_demand.begin(), by_demand.end(),
	                 [](const DayDemand &lhs, const DayDemand &rhs) { return lhs.demand > rhs.demand; });
	result.peak_days.assign(by_demand.begin(), by_demand.begin() + static_cast<std::ptrdiff_t>(count));

	std::stable_sort(days.begin(), days.end(),
	                 [](const DayDemand &lhs, const DayDemand &rhs) { return lhs.demand < rhs.demand; });
	result.low_days.assign(days.begin(), days.begin() + static_cast<std::ptrdiff_t>(count));
	return result;
}

detectors::AnomalyReport ForecastOrchestrator::detectAnomalies(const std::vector<series::DemandEvent> &events,
                                                               const core::CalendarDate &start,
                                                               const core::CalendarDate &end,
                                                               const core::ProductInfo &product) const {
	return detectAnomalies(series_builder_.build(events, start, end), product);
}

detectors::AnomalyReport ForecastOrchestrator::detectAnomalies(const core::DemandSeries &history,
                                                               const core::ProductInfo &product) const {
	if (config_.anomaly_on_cleaned) {
		return anomaly_detector_.detect(outlier_filter_->filter(history), product);
	}
	return anomaly_detector_.detect(history, product);
}

} // namespace demandcast::engine
