#pragma once

#include "demand-cast/calendar/calendar_effects.hpp"
#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/errors.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace demandcast::detectors {

enum class AnomalyType { Spike, Drop, SeasonalDeviation, TrendBreak };

std::string toString(AnomalyType type);

enum class ActionPriority { Low, Medium, High };

std::string toString(ActionPriority priority);

struct RecommendedAction {
	std::string action;
	ActionPriority priority = ActionPriority::Medium;
	std::string timeline;
};

struct BusinessImpact {
	double revenue_impact = 0.0;
	double inventory_impact = 0.0;
	double customer_satisfaction_impact = 0.0;
};

struct PatternContext {
	bool is_recurring = false;
	std::optional<std::string> frequency; ///< "weekly" or "monthly".
	bool seasonal_pattern = false;
};

struct Anomaly {
	core::CalendarDate date;
	AnomalyType type = AnomalyType::Spike;
	double expected = 0.0; ///< Mean of the preceding window.
	double actual = 0.0;
	double deviation_percent = 0.0;
	double z_score = 0.0;
	double severity_score = 0.0;
	double confidence = 0.0;
	std::vector<std::string> possible_causes;
	BusinessImpact business_impact;
	std::vector<RecommendedAction> recommended_actions;
	PatternContext pattern_context;
};

struct SeverityDistribution {
	std::size_t critical = 0; ///< severity >= 0.8
	std::size_t high = 0;     ///< >= 0.6
	std::size_t medium = 0;   ///< >= 0.4
	std::size_t low = 0;
};

struct AnomalySummary {
	std::size_t total = 0;
	std::size_t spikes = 0;
	std::size_t drops = 0;
	std::size_t seasonal_deviations = 0;
	std::size_t trend_breaks = 0;
	SeverityDistribution severity;
	double average_deviation_percent = 0.0; ///< Mean |deviation|.
	std::vector<std::string> common_patterns;
};

struct AnomalyReport {
	core::ProductInfo product;
	/// Sorted by severity, then by date, both descending.
	std::vector<Anomaly> anomalies;
	AnomalySummary summary;
	core::DataStatus status = core::DataStatus::InsufficientData;
};

struct AnomalyConfig {
	int sensitivity_level = 5;           ///< 1 (z > 3.0) ... 10 (z > 1.2).
	double min_deviation_percent = 25.0;
	std::size_t window = 7;
	bool detect_spikes = true;
	bool detect_drops = true;
	bool detect_seasonal = true;
	/// Score given to a value differing from a window with no variance.
	double zero_variance_z_score = 10.0;
	double spike_drop_percent = 50.0;
	double seasonal_percent = 25.0;

	/**
	 * @throws std::invalid_argument If the sensitivity is outside 1-10 or another field is out of range.
	 */
	void validate() const;
};

/**
 * @class AnomalyDetector
 * @brief Sliding-window z-score detector over daily demand.
 *
 * Each point after the first window is compared with the mean and population standard
 * deviation of the window before it. A point is reported when its z-score exceeds the
 * sensitivity threshold and its deviation from the mean is at least the minimum percent.
 */
class AnomalyDetector {
public:
	explicit AnomalyDetector(AnomalyConfig config = {},
	                         std::shared_ptr<const calendar::CalendarEffectCalculator> calendar = nullptr);

	AnomalyReport detect(const core::DemandSeries &series, const core::ProductInfo &product = {}) const;

	/// z-score threshold for a sensitivity level; levels outside 1-10 are clamped.
	static double sensitivityThreshold(int level);

	static std::string severityLevel(double severity_score);

	AnomalyType classify(double deviation_percent, double actual, double expected,
	                     const core::CalendarDate &date) const;

	const AnomalyConfig &config() const {
		return config_;
	}

private:
	bool isEnabled(AnomalyType type) const;
	std::vector<std::string> possibleCauses(AnomalyType type, const core::CalendarDate &date,
	                                        double deviation_percent) const;
	static BusinessImpact businessImpact(AnomalyType type, double actual, double expected, double unit_price);
	static std::vector<RecommendedAction> recommendations(AnomalyType type, double severity_score);
	static PatternContext patternContext(AnomalyType type, const core::CalendarDate &date);
	static AnomalySummary summarize(const std::vector<Anomaly> &anomalies);

	AnomalyConfig config_;
	std::shared_ptr<const calendar::CalendarEffectCalculator> calendar_;
};

} // namespace demandcast::detectors
