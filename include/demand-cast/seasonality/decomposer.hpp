#pragma once

#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/errors.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace demandcast::seasonality {

/**
 * @struct Decomposition
 * @brief Additive split value[i] = trend[i] + seasonal[i] + residual[i].
 */
struct Decomposition {
	std::vector<double> trend;
	std::vector<double> seasonal;
	std::vector<double> residual;
	/// Seasonal offset per day of week (0 = Sunday).
	std::array<double, 7> seasonal_index {};
	/// Mean demand, or the configured default for an empty series.
	double baseline = 0.0;
	/// Share of variance carried by the seasonal component, in [0, 1].
	double seasonality_strength = 0.0;
	core::DataStatus status = core::DataStatus::InsufficientData;
};

/**
 * @class SeasonalDecomposer
 * @brief Smoothed moving-average trend with day-of-week seasonal indices.
 *
 * The first window points take the expanding mean as trend. Past that, each trend point is
 * alpha * MA(window) + (1 - alpha) * previous trend.
 */
class SeasonalDecomposer {
public:
	class Builder {
	public:
		Builder &window(std::size_t value);
		Builder &alpha(double value);
		Builder &minSamples(std::size_t value);
		Builder &defaultBaseline(double value);
		SeasonalDecomposer build() const;

	private:
		std::size_t window_ = 7;
		double alpha_ = 0.3;
		std::size_t min_samples_ = 14;
		double default_baseline_ = 10.0;
	};

	static Builder builder();

	Decomposition decompose(const core::DemandSeries &series) const;

private:
	SeasonalDecomposer(std::size_t window, double alpha, std::size_t min_samples, double default_baseline);

	std::size_t window_;
	double alpha_;
	std::size_t min_samples_;
	double default_baseline_;
};

} // namespace demandcast::seasonality
