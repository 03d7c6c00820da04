#include "demand-cast/seasonality/decomposer.hpp"
#include "demand-cast/utils/logging.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <algorithm>
#include <stdexcept>

namespace demandcast::seasonality {

SeasonalDecomposer::SeasonalDecomposer(std::size_t window, double alpha, std::size_t min_samples,
                                       double default_baseline)
    : window_(window), alpha_(alpha), min_samples_(min_samples), default_baseline_(default_baseline) {
	if (window_ == 0) {
		throw std::invalid_argument("Decomposition window must be positive.");
	}
	if (!(alpha_ >= 0.0 && alpha_ <= 1.0)) {
		throw std::invalid_argument("Decomposition alpha must be in [0, 1].");
	}
}

SeasonalDecomposer::Builder &SeasonalDecomposer::Builder::window(std::size_t value) {
	window_ = value;
	return *this;
}

SeasonalDecomposer::Builder &SeasonalDecomposer::Builder::alpha(double value) {
	alpha_ = value;
	return *this;
}

SeasonalDecomposer::Builder &SeasonalDecomposer::Builder::minSamples(std::size_t value) {
	min_samples_ = value;
	return *this;
}

SeasonalDecomposer::Builder &SeasonalDecomposer::Builder::defaultBaseline(double value) {
	default_baseline_ = value;
	return *this;
}

SeasonalDecomposer SeasonalDecomposer::Builder::build() const {
	return SeasonalDecomposer(window_, alpha_, min_samples_, default_baseline_);
}

SeasonalDecomposer::Builder SeasonalDecomposer::builder() {
	return Builder();
}

Decomposition SeasonalDecomposer::decompose(const core::DemandSeries &series) const {
	Decomposition result;
	const std::vector<double> values = series.values();
	const std::size_t n = values.size();

	if (n == 0) {
		DEMANDCAST_WARN("Decomposition of an empty series. Using baseline {}.", default_baseline_);
		result.baseline = default_baseline_;
		return result;
	}

	result.baseline = utils::stats::mean(values);

	if (n < min_samples_) {
		DEMANDCAST_DEBUG("Decomposition needs {} points, got {}. Using a flat trend.", min_samples_, n);
		result.trend.assign(n, result.baseline);
		result.seasonal.assign(n, 0.0);
		result.residual.reserve(n);
		for (double v : values) {
			result.residual.push_back(v - result.baseline);
		}
		return result;
	}

	// Trend
	result.trend.resize(n);
	double running_sum = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		running_sum += values[i];
		if (i < window_) {
			result.trend[i] = running_sum / static_cast<double>(i + 1);
			continue;
		}
		running_sum -= values[i - window_];
		const double moving_average = running_sum / static_cast<double>(window_);
		result.trend[i] = alpha_ * moving_average + (1.0 - alpha_) * result.trend[i - 1];
	}

	// Day-of-week seasonal indices
	std::array<double, 7> sums {};
	std::array<std::size_t, 7> counts {};
	for (std::size_t i = 0; i < n; ++i) {
		const auto dow = static_cast<std::size_t>(series[i].day_of_week);
		sums[dow] += values[i] - result.trend[i];
		++counts[dow];
	}
	for (std::size_t d = 0; d < 7; ++d) {
		result.seasonal_index[d] = counts[d] > 0 ? sums[d] / static_cast<double>(counts[d]) : 0.0;
	}

	result.seasonal.resize(n);
	result.residual.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		result.seasonal[i] = result.seasonal_index[static_cast<std::size_t>(series[i].day_of_week)];
		result.residual[i] = values[i] - result.trend[i] - result.seasonal[i];
	}

	const double total_variance = utils::stats::variance(values);
	if (total_variance > 0.0) {
		result.seasonality_strength = std::min(1.0, utils::stats::variance(result.seasonal) / total_variance);
	}
	result.status = core::DataStatus::Sufficient;
	return result;
}

} // namespace demandcast::seasonality
