#include "demand-cast/models/holt_winters.hpp"
#include "demand-cast/utils/logging.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandcast::models {

namespace {

bool isSmoothingConstant(double value) {
	return value >= 0.0 && value <= 1.0;
}

} // namespace

void HoltWintersConfig::validate() const {
	if (!isSmoothingConstant(alpha) || !isSmoothingConstant(beta) || !isSmoothingConstant(gamma)) {
		throw std::invalid_argument("Holt-Winters smoothing constants must be in [0, 1].");
	}
	if (season_length < 1) {
		throw std::invalid_argument("Holt-Winters season length must be positive.");
	}
}

HoltWinters::HoltWinters(HoltWintersConfig config) : config_(config) {
	config_.validate();
}

HoltWintersState HoltWinters::initialize(const std::vector<double> &values, const HoltWintersConfig &config) {
	const auto m = static_cast<std::size_t>(config.season_length);
	HoltWintersState state;
	state.seasonal.assign(m, 0.0);
	if (values.empty()) {
		return state;
	}

	state.level = values.front();
	state.trend = values.size() > 1 ? values[1] - values[0] : 0.0;

	const double overall_mean = utils::stats::mean(values);
	std::vector<double> sums(m, 0.0);
	std::vector<std::size_t> counts(m, 0);
	for (std::size_t t = 0; t < values.size(); ++t) {
		sums[t % m] += values[t];
		++counts[t % m];
	}
	for (std::size_t k = 0; k < m; ++k) {
		if (counts[k] > 0) {
			state.seasonal[k] = sums[k] / static_cast<double>(counts[k]) - overall_mean;
		}
	}
	return state;
}

HoltWintersState HoltWinters::step(const HoltWintersState &state, double value, std::size_t t,
                                   const HoltWintersConfig &config) {
	const std::size_t phase = t % state.seasonal.size();
	HoltWintersState next = state;
	next.level = config.alpha * (value - state.seasonal[phase]) + (1.0 - config.alpha) * (state.level + state.trend);
	next.trend = config.beta * (next.level - state.level) + (1.0 - config.beta) * state.trend;
	next.seasonal[phase] = config.gamma * (value - next.level) + (1.0 - config.gamma) * state.seasonal[phase];
	return next;
}

void HoltWinters::fit(const core::DemandSeries &series) {
	fit(series.values());
}

void HoltWinters::fit(const std::vector<double> &values) {
	history_size_ = values.size();
	fallback_mean_ = utils::stats::mean(values);
	degraded_ = values.size() < config_.min_samples;
	is_fitted_ = true;

	if (degraded_) {
		state_ = HoltWintersState {};
		DEMANDCAST_WARN("HoltWinters has {} points (< {}). Forecasting the historical mean {:.2f}.", values.size(),
		                config_.min_samples, fallback_mean_);
		return;
	}

	HoltWintersState state = initialize(values, config_);
	for (std::size_t t = 1; t < values.size(); ++t) {
		state = step(state, values[t], t, config_);
	}
	state_ = std::move(state);
	DEMANDCAST_DEBUG("HoltWinters fitted on {} points: level {:.3f}, trend {:.3f}.", history_size_, state_.level,
	                 state_.trend);
}

core::Forecast HoltWinters::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("HoltWinters::predict called before fit");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must not be negative.");
	}

	core::Forecast forecast;
	forecast.point.reserve(static_cast<std::size_t>(horizon));
	if (degraded_) {
		forecast.point.assign(static_cast<std::size_t>(horizon), std::max(0.0, fallback_mean_));
		return forecast;
	}

	const std::size_t m = state_.seasonal.size();
	for (int i = 0; i < horizon; ++i) {
		const auto steps_ahead = static_cast<double>(i + 1);
		const double seasonal = state_.seasonal[(history_size_ + static_cast<std::size_t>(i)) % m];
		forecast.point.push_back(std::max(0.0, state_.level + steps_ahead * state_.trend + seasonal));
	}
	return forecast;
}

} // namespace demandcast::models
