#pragma once

#include "demand-cast/calendar/calendar_effects.hpp"
#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/errors.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace demandcast::seasonality {

struct PeriodStrength {
	std::uint32_t period = 0;
	double autocorrelation = 0.0;
};

struct SeasonalityResult {
	bool detected = false;
	/// max(autocorrelation, weekly, calendar) strengths, clamped to [0, 1].
	double strength = 0.0;
	/// Candidate period with the strongest autocorrelation; 0 if none had two full cycles.
	std::uint32_t period = 0;
	std::vector<std::string> peak_periods;

	std::vector<PeriodStrength> candidates;
	double autocorrelation_strength = 0.0;
	double weekly_strength = 0.0;
	double calendar_strength = 0.0;
	/// Relative lift of the Ramadan / Lebaran average over ordinary days.
	double ramadan_effect = 0.0;
	double lebaran_effect = 0.0;

	core::DataStatus status = core::DataStatus::InsufficientData;
};

/**
 * @class SeasonalityDetector
 * @brief Tests candidate periods by autocorrelation and combines them with weekly and calendar patterns.
 */
class SeasonalityDetector {
public:
	class Builder {
	public:
		Builder &candidatePeriods(std::vector<std::uint32_t> value);
		Builder &threshold(double value);
		Builder &minSamples(std::size_t value);
		Builder &calendar(std::shared_ptr<const calendar::CalendarEffectCalculator> value);
		SeasonalityDetector build() const;

	private:
		std::vector<std::uint32_t> candidate_periods_ = {7, 14, 30};
		double threshold_ = 0.3;
		std::size_t min_samples_ = 14;
		std::shared_ptr<const calendar::CalendarEffectCalculator> calendar_;
	};

	static Builder builder();

	SeasonalityResult detect(const core::DemandSeries &series) const;

	static std::string weekdayName(int day_of_week);

private:
	SeasonalityDetector(std::vector<std::uint32_t> candidate_periods, double threshold, std::size_t min_samples,
	                    std::shared_ptr<const calendar::CalendarEffectCalculator> calendar);

	std::vector<std::uint32_t> candidate_periods_;
	double threshold_;
	std::size_t min_samples_;
	std::shared_ptr<const calendar::CalendarEffectCalculator> calendar_;
};

} // namespace demandcast::seasonality
