#include "demand-cast/engine/engine_config.hpp"

#include <cmath>
#include <stdexcept>

namespace demandcast::engine {

void EngineConfig::validate() const {
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw std::invalid_argument("Confidence level must be in (0, 1).");
	}
	if (!(interval_widening >= 0.0)) {
		throw std::invalid_argument("Interval widening must be non-negative.");
	}

	holt_winters.validate();
	calendar.validate();
	anomaly.validate();
	auto bt = backtest;
	bt.horizon = horizon;
	bt.validate();

	if (!(outlier_multiplier >= 0.0) || outlier_min_samples == 0) {
		throw std::invalid_argument("Outlier filter needs a non-negative multiplier and a positive sample count.");
	}
	if (trend_min_samples < 3) {
		throw std::invalid_argument("Trend analysis needs at least 3 samples.");
	}
	if (!(trend_significance > 0.0 && trend_significance < 1.0)) {
		throw std::invalid_argument("Trend significance must be in (0, 1).");
	}
	if (!(trend_decay >= 0.0)) {
		throw std::invalid_argument("Trend decay must be non-negative.");
	}
	if (decomposition_window == 0 || !(decomposition_alpha >= 0.0 && decomposition_alpha <= 1.0)) {
		throw std::invalid_argument("Decomposition needs a positive window and alpha in [0, 1].");
	}
	if (candidate_periods.empty() || !(seasonality_threshold >= 0.0 && seasonality_threshold <= 1.0)) {
		throw std::invalid_argument("Seasonality needs candidate periods and a threshold in [0, 1].");
	}
	for (double factor : weekday_profile) {
		if (!(factor >= 0.0) || !std::isfinite(factor)) {
			throw std::invalid_argument("Weekday profile factors must be non-negative.");
		}
	}
	if (!(learned_seasonal_weight >= 0.0 && learned_seasonal_weight <= 1.0)) {
		throw std::invalid_argument("Learned seasonal weight must be in [0, 1].");
	}
}

} // namespace demandcast::engine
