#include "demand-cast/seasonality/detector.hpp"
#include "demand-cast/utils/logging.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace demandcast::seasonality {

namespace {

double relativeLift(double period_sum, std::size_t period_count, double normal_average) {
	if (period_count == 0 || normal_average <= 0.0) {
		return 0.0;
	}
	const double period_average = period_sum / static_cast<double>(period_count);
	return (period_average - normal_average) / normal_average;
}

} // namespace

SeasonalityDetector::SeasonalityDetector(std::vector<std::uint32_t> candidate_periods, double threshold,
                                         std::size_t min_samples,
                                         std::shared_ptr<const calendar::CalendarEffectCalculator> calendar)
    : candidate_periods_(std::move(candidate_periods)), threshold_(threshold), min_samples_(min_samples),
      calendar_(std::move(calendar)) {
	if (candidate_periods_.empty()) {
		throw std::invalid_argument("SeasonalityDetector needs at least one candidate period.");
	}
	if (std::any_of(candidate_periods_.begin(), candidate_periods_.end(), [](std::uint32_t p) { return p < 2; })) {
		throw std::invalid_argument("Candidate periods must be at least 2.");
	}
	if (!(threshold_ >= 0.0 && threshold_ <= 1.0)) {
		throw std::invalid_argument("Seasonality threshold must be in [0, 1].");
	}
	if (!calendar_) {
		calendar_ = std::make_shared<const calendar::CalendarEffectCalculator>();
	}
}

SeasonalityDetector::Builder &SeasonalityDetector::Builder::candidatePeriods(std::vector<std::uint32_t> value) {
	candidate_periods_ = std::move(value);
	return *this;
}

SeasonalityDetector::Builder &SeasonalityDetector::Builder::threshold(double value) {
	threshold_ = value;
	return *this;
}

SeasonalityDetector::Builder &SeasonalityDetector::Builder::minSamples(std::size_t value) {
	min_samples_ = value;
	return *this;
}

SeasonalityDetector::Builder &
SeasonalityDetector::Builder::calendar(std::shared_ptr<const calendar::CalendarEffectCalculator> value) {
	calendar_ = std::move(value);
	return *this;
}

SeasonalityDetector SeasonalityDetector::Builder::build() const {
	return SeasonalityDetector(candidate_periods_, threshold_, min_samples_, calendar_);
}

SeasonalityDetector::Builder SeasonalityDetector::builder() {
	return Builder();
}

std::string SeasonalityDetector::weekdayName(int day_of_week) {
	static const std::array<const char *, 7> names = {"Sunday",   "Monday", "Tuesday", "Wednesday",
	                                                  "Thursday", "Friday", "Saturday"};
	if (day_of_week < 0 || day_of_week > 6) {
		throw std::out_of_range("Day of week must be between 0 and 6.");
	}
	return names[static_cast<std::size_t>(day_of_week)];
}

SeasonalityResult SeasonalityDetector::detect(const core::DemandSeries &series) const {
	SeasonalityResult result;
	const std::vector<double> values = series.values();
	const std::size_t n = values.size();
	if (n < min_samples_) {
		DEMANDCAST_DEBUG("Seasonality detection skipped: {} points < {}.", n, min_samples_);
		return result;
	}

	// Autocorrelation at each candidate lag with two full cycles of data.
	for (const auto period : candidate_periods_) {
		if (n < static_cast<std::size_t>(period) * 2) {
			continue;
		}
		const double r = utils::stats::autocorrelation(values, period);
		result.candidates.push_back({period, r});
		if (std::abs(r) > result.autocorrelation_strength || result.period == 0) {
			result.autocorrelation_strength = std::abs(r);
			result.period = period;
		}
	}

	// Weekly pattern
	const double overall_mean = utils::stats::mean(values);
	std::array<double, 7> day_sums {};
	std::array<std::size_t, 7> day_counts {};
	for (const auto &obs : series) {
		day_sums[static_cast<std::size_t>(obs.day_of_week)] += obs.value;
		++day_counts[static_cast<std::size_t>(obs.day_of_week)];
	}
	std::vector<double> day_averages;
	std::array<double, 7> average_by_day {};
	for (std::size_t d = 0; d < 7; ++d) {
		if (day_counts[d] > 0) {
			average_by_day[d] = day_sums[d] / static_cast<double>(day_counts[d]);
			day_averages.push_back(average_by_day[d]);
		}
	}
	if (overall_mean > 0.0) {
		result.weekly_strength = utils::stats::stdDev(day_averages) / overall_mean;
	}

	// Calendar pattern
	double ramadan_sum = 0.0;
	double lebaran_sum = 0.0;
	double normal_sum = 0.0;
	std::size_t ramadan_count = 0;
	std::size_t lebaran_count = 0;
	std::size_t normal_count = 0;
	for (const auto &obs : series) {
		if (calendar_->isRamadan(obs.date)) {
			ramadan_sum += obs.value;
			++ramadan_count;
		} else if (calendar_->isLebaran(obs.date)) {
			lebaran_sum += obs.value;
			++lebaran_count;
		} else {
			normal_sum += obs.value;
			++normal_count;
		}
	}
	const double normal_average = normal_count > 0 ? normal_sum / static_cast<double>(normal_count) : 0.0;
	result.ramadan_effect = relativeLift(ramadan_sum, ramadan_count, normal_average);
	result.lebaran_effect = relativeLift(lebaran_sum, lebaran_count, normal_average);
	result.calendar_strength = std::max(std::abs(result.ramadan_effect), std::abs(result.lebaran_effect));

	const double combined =
	    std::max({result.autocorrelation_strength, result.weekly_strength, result.calendar_strength});
	result.strength = std::clamp(combined, 0.0, 1.0);
	result.detected = result.strength > threshold_;

	for (std::size_t d = 0; d < 7; ++d) {
		if (day_counts[d] > 0 && average_by_day[d] > overall_mean) {
			result.peak_periods.push_back(weekdayName(static_cast<int>(d)));
		}
	}
	if (result.ramadan_effect > 0.2) {
		result.peak_periods.emplace_back("Ramadan Period");
	}
	if (result.lebaran_effect > 0.3) {
		result.peak_periods.emplace_back("Lebaran Period");
	}

	result.status = core::DataStatus::Sufficient;
	DEMANDCAST_DEBUG("Seasonality strength {:.3f} (acf {:.3f}, weekly {:.3f}, calendar {:.3f}), period {}.",
	                 result.strength, result.autocorrelation_strength, result.weekly_strength,
	                 result.calendar_strength, result.period);
	return result;
}

} // namespace demandcast::seasonality
