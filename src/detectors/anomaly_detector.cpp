#include "demand-cast/detectors/anomaly_detector.hpp"
#include "demand-cast/utils/logging.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace demandcast::detectors {

std::string toString(AnomalyType type) {
	switch (type) {
	case AnomalyType::Spike:
		return "spike";
	case AnomalyType::Drop:
		return "drop";
	case AnomalyType::SeasonalDeviation:
		return "seasonal_deviation";
	case AnomalyType::TrendBreak:
		return "trend_break";
	}
	return "unknown";
}

std::string toString(ActionPriority priority) {
	switch (priority) {
	case ActionPriority::Low:
		return "low";
	case ActionPriority::Medium:
		return "medium";
	case ActionPriority::High:
		return "high";
	}
	return "unknown";
}

void AnomalyConfig::validate() const {
	if (sensitivity_level < 1 || sensitivity_level > 10) {
		throw std::invalid_argument("Sensitivity level must be between 1 and 10.");
	}
	if (!(min_deviation_percent >= 0.0)) {
		throw std::invalid_argument("Minimum deviation percent must be non-negative.");
	}
	if (window < 2) {
		throw std::invalid_argument("Anomaly window must hold at least 2 points.");
	}
	if (!(zero_variance_z_score >= 0.0)) {
		throw std::invalid_argument("Zero-variance z-score must be non-negative.");
	}
	if (!(seasonal_percent >= 0.0) || !(spike_drop_percent >= seasonal_percent)) {
		throw std::invalid_argument("Classification bands must satisfy 0 <= seasonal <= spike/drop.");
	}
}

AnomalyDetector::AnomalyDetector(AnomalyConfig config,
                                 std::shared_ptr<const calendar::CalendarEffectCalculator> calendar)
    : config_(config), calendar_(std::move(calendar)) {
	config_.validate();
	if (!calendar_) {
		calendar_ = std::make_shared<const calendar::CalendarEffectCalculator>();
	}
}

double AnomalyDetector::sensitivityThreshold(int level) {
	static constexpr std::array<double, 10> thresholds = {3.0, 2.8, 2.6, 2.4, 2.2, 2.0, 1.8, 1.6, 1.4, 1.2};
	const int index = std::clamp(level - 1, 0, 9);
	return thresholds[static_cast<std::size_t>(index)];
}

std::string AnomalyDetector::severityLevel(double severity_score) {
	if (severity_score >= 0.8)
		return "critical";
	if (severity_score >= 0.6)
		return "high";
	if (severity_score >= 0.4)
		return "medium";
	return "low";
}

AnomalyType AnomalyDetector::classify(double deviation_percent, double actual, double expected,
                                      const core::CalendarDate &date) const {
	if (deviation_percent > config_.spike_drop_percent) {
		return AnomalyType::Spike;
	}
	if (deviation_percent < -config_.spike_drop_percent) {
		return AnomalyType::Drop;
	}
	if (std::abs(deviation_percent) > config_.seasonal_percent) {
		return date.isWeekend() ? AnomalyType::SeasonalDeviation : AnomalyType::TrendBreak;
	}
	return actual > expected ? AnomalyType::Spike : AnomalyType::Drop;
}

bool AnomalyDetector::isEnabled(AnomalyType type) const {
	switch (type) {
	case AnomalyType::Spike:
		return config_.detect_spikes;
	case AnomalyType::Drop:
		return config_.detect_drops;
	case AnomalyType::SeasonalDeviation:
		return config_.detect_seasonal;
	case AnomalyType::TrendBreak:
		return true;
	}
	return true;
}

std::vector<std::string> AnomalyDetector::possibleCauses(AnomalyType type, const core::CalendarDate &date,
                                                         double deviation_percent) const {
	std::vector<std::string> causes;
	if (const auto holiday = calendar_->holidayName(date)) {
		causes.push_back(*holiday + " holiday effect");
	}
	if (date.isWeekend()) {
		causes.emplace_back("Weekend demand pattern");
	}
	if (date.month() == 12 || date.month() == 1) {
		causes.emplace_back("Year-end holiday season effect");
	}

	if (type == AnomalyType::Spike) {
		causes.emplace_back("Promotional campaign or viral marketing");
		causes.emplace_back("Competitor stockout or supply shortage");
		causes.emplace_back("Social media influence or trending product");
		if (std::abs(deviation_percent) > 100.0) {
			causes.emplace_back("One-time bulk purchase or B2B order");
		}
	} else if (type == AnomalyType::Drop) {
		causes.emplace_back("Competitor promotion or price war");
		causes.emplace_back("Product quality issue or negative review");
		causes.emplace_back("Supply chain disruption");
		causes.emplace_back("Economic or external market factors");
	}

	causes.emplace_back("Data quality issue or system error");
	causes.emplace_back("Seasonal shift or trend change");
	return causes;
}

BusinessImpact AnomalyDetector::businessImpact(AnomalyType type, double actual, double expected, double unit_price) {
	BusinessImpact impact;
	const double difference = actual - expected;
	impact.revenue_impact = difference * unit_price;

	if (type == AnomalyType::Spike) {
		// Stock drained faster than planned.
		impact.inventory_impact = -difference;
		impact.customer_satisfaction_impact = impact.inventory_impact < -10.0 ? -20.0 : 0.0;
	} else if (type == AnomalyType::Drop) {
		impact.inventory_impact = -difference;
		impact.customer_satisfaction_impact = difference < -20.0 ? -10.0 : 0.0;
	}
	return impact;
}

std::vector<RecommendedAction> AnomalyDetector::recommendations(AnomalyType type, double severity_score) {
	std::vector<RecommendedAction> actions;
	if (type == AnomalyType::Spike) {
		actions.push_back({"Investigate demand drivers and capitalize on the opportunity", ActionPriority::High,
		                   "Immediate (24 hours)"});
		if (severity_score > 0.7) {
			actions.push_back(
			    {"Check inventory levels and prepare an emergency restock", ActionPriority::High, "Immediate"});
		}
		actions.push_back({"Analyze customer segments for targeted marketing", ActionPriority::Medium, "1-3 days"});
	} else if (type == AnomalyType::Drop) {
		actions.push_back({"Investigate root cause: competitors, quality, pricing", ActionPriority::High,
		                   "Immediate (24 hours)"});
		actions.push_back({"Review marketing strategy and promotional activities", ActionPriority::Medium, "2-5 days"});
		if (severity_score > 0.7) {
			actions.push_back(
			    {"Consider a pricing adjustment or promotional campaign", ActionPriority::High, "1-2 days"});
		}
	}
	actions.push_back({"Update demand forecast models with the new data", ActionPriority::Medium, "1 week"});
	actions.push_back({"Set up monitoring alerts for similar patterns", ActionPriority::Low, "2 weeks"});
	return actions;
}

PatternContext AnomalyDetector::patternContext(AnomalyType type, const core::CalendarDate &date) {
	PatternContext context;
	if (date.isWeekend() && type == AnomalyType::Drop) {
		context.frequency = "weekly";
	} else if (date.dayOfWeek() == 1 && type == AnomalyType::Spike) {
		context.frequency = "weekly";
	} else if (date.day() > 25 && type == AnomalyType::Spike) {
		context.frequency = "monthly";
	}
	context.is_recurring = context.frequency.has_value();
	context.seasonal_pattern = context.is_recurring;
	return context;
}

AnomalySummary AnomalyDetector::summarize(const std::vector<Anomaly> &anomalies) {
	AnomalySummary summary;
	summary.total = anomalies.size();
	double deviation_sum = 0.0;
	std::size_t weekend_count = 0;

	for (const auto &anomaly : anomalies) {
		switch (anomaly.type) {
		case AnomalyType::Spike:
			++summary.spikes;
			break;
		case AnomalyType::Drop:
			++summary.drops;
			break;
		case AnomalyType::SeasonalDeviation:
			++summary.seasonal_deviations;
			break;
		case AnomalyType::TrendBreak:
			++summary.trend_breaks;
			break;
		}

		const std::string level = severityLevel(anomaly.severity_score);
		if (level == "critical") {
			++summary.severity.critical;
		} else if (level == "high") {
			++summary.severity.high;
		} else if (level == "medium") {
			++summary.severity.medium;
		} else {
			++summary.severity.low;
		}

		deviation_sum += std::abs(anomaly.deviation_percent);
		if (anomaly.date.isWeekend()) {
			++weekend_count;
		}
	}

	if (summary.total == 0) {
		return summary;
	}
	summary.average_deviation_percent = deviation_sum / static_cast<double>(summary.total);

	if (static_cast<double>(weekend_count) > static_cast<double>(summary.total) * 0.3) {
		summary.common_patterns.emplace_back("Weekend patterns differ significantly from weekdays");
	}
	if (summary.spikes > summary.drops * 2) {
		summary.common_patterns.emplace_back("More demand spikes than drops: growing market");
	} else if (summary.drops > summary.spikes * 2) {
		summary.common_patterns.emplace_back("More demand drops than spikes: declining trend");
	}
	return summary;
}

AnomalyReport AnomalyDetector::detect(const core::DemandSeries &series, const core::ProductInfo &product) const {
	AnomalyReport report;
	report.product = product;

	const std::size_t window = config_.window;
	if (series.size() <= window) {
		DEMANDCAST_DEBUG("Anomaly detection needs more than {} points, got {}.", window, series.size());
		return report;
	}

	const double threshold = sensitivityThreshold(config_.sensitivity_level);
	for (std::size_t i = window; i < series.size(); ++i) {
		const auto &current = series[i];
		double window_sum = 0.0;
		for (std::size_t j = i - window; j < i; ++j) {
			window_sum += series[j].value;
		}
		const double mean = window_sum / static_cast<double>(window);
		double squares = 0.0;
		for (std::size_t j = i - window; j < i; ++j) {
			const double diff = series[j].value - mean;
			squares += diff * diff;
		}
		const double std_dev = std::sqrt(squares / static_cast<double>(window));

		double z_score = 0.0;
		if (std_dev > 0.0) {
			z_score = std::abs(current.value - mean) / std_dev;
		} else if (current.value != mean) {
			z_score = config_.zero_variance_z_score;
		}
		if (z_score <= threshold) {
			continue;
		}

		const double deviation_percent = mean > 0.0 ? (current.value - mean) / mean * 100.0 : 0.0;
		if (std::abs(deviation_percent) < config_.min_deviation_percent) {
			continue;
		}

		const AnomalyType type = classify(deviation_percent, current.value, mean, current.date);
		if (!isEnabled(type)) {
			continue;
		}

		Anomaly anomaly;
		anomaly.date = current.date;
		anomaly.type = type;
		anomaly.expected = mean;
		anomaly.actual = current.value;
		anomaly.deviation_percent = deviation_percent;
		anomaly.z_score = z_score;
		anomaly.severity_score = std::min(1.0, z_score / 3.0);
		anomaly.confidence = std::clamp(anomaly.severity_score, 0.5, 1.0);
		anomaly.possible_causes = possibleCauses(type, current.date, deviation_percent);
		anomaly.business_impact = businessImpact(type, current.value, mean, product.unit_price);
		anomaly.recommended_actions = recommendations(type, anomaly.severity_score);
		anomaly.pattern_context = patternContext(type, current.date);
		report.anomalies.push_back(std::move(anomaly));
	}

	std::sort(report.anomalies.begin(), report.anomalies.end(), [](const Anomaly &lhs, const Anomaly &rhs) {
		if (lhs.severity_score != rhs.severity_score) {
			return lhs.severity_score > rhs.severity_score;
		}
		return lhs.date > rhs.date;
	});

	report.summary = summarize(report.anomalies);
	report.status = core::DataStatus::Sufficient;
	DEMANDCAST_INFO("Detected {} demand anomalies for '{}' ({} spikes, {} drops).", report.summary.total,
	                product.id.empty() ? std::string("series") : product.id, report.summary.spikes,
	                report.summary.drops);
	return report;
}

} // namespace demandcast::detectors
