#pragma once

#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/errors.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace demandcast::trend {

enum class TrendDirection { Increasing, Decreasing, Stable };

std::string toString(TrendDirection direction);

struct MannKendallResult {
	double s = 0.0;
	double variance = 0.0;
	double z = 0.0;
	double p_value = 1.0;
};

struct TrendResult {
	TrendDirection direction = TrendDirection::Stable;
	double slope = 0.0;
	double intercept = 0.0;
	double r_squared = 0.0;
	double p_value = 1.0;
	/// r_squared * (1 - p_value).
	double confidence = 0.0;
	core::DataStatus status = core::DataStatus::InsufficientData;
};

/**
 * @class TrendAnalyzer
 * @brief Linear trend over the observation index, tested with Mann-Kendall.
 *
 * The slope comes from ordinary least squares of value against index 0..n-1. Direction is
 * reported only when the Mann-Kendall p-value is below the significance level. Tied values
 * are not corrected for in the Mann-Kendall variance.
 */
class TrendAnalyzer {
public:
	class Builder {
	public:
		Builder &minSamples(std::size_t value);
		Builder &significance(double value);
		TrendAnalyzer build() const;

	private:
		std::size_t min_samples_ = 3;
		double significance_ = 0.05;
	};

	static Builder builder();

	TrendResult analyze(const core::DemandSeries &series) const;
	TrendResult analyze(const std::vector<double> &values) const;

	static MannKendallResult mannKendall(const std::vector<double> &values);

	std::size_t minSamples() const {
		return min_samples_;
	}

private:
	TrendAnalyzer(std::size_t min_samples, double significance);

	std::size_t min_samples_;
	double significance_;
};

} // namespace demandcast::trend
