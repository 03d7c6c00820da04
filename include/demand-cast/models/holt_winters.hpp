#pragma once

#include "demand-cast/models/iforecaster.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace demandcast::models {

struct HoltWintersConfig {
	double alpha = 0.3; ///< Level smoothing.
	double beta = 0.1;  ///< Trend smoothing.
	double gamma = 0.2; ///< Seasonal smoothing.
	int season_length = 7;
	/// Below this many points the forecaster repeats the historical mean.
	std::size_t min_samples = 7;

	/**
	 * @throws std::invalid_argument If a smoothing constant is outside [0, 1] or the season length is not positive.
	 */
	void validate() const;
};

/**
 * @struct HoltWintersState
 * @brief Level, trend and additive seasonal indices after consuming a prefix of the history.
 */
struct HoltWintersState {
	double level = 0.0;
	double trend = 0.0;
	std::vector<double> seasonal;
};

/**
 * @brief Additive Holt-Winters (triple exponential smoothing) with fixed smoothing constants.
 *
 * Initialisation: level is the first value, trend the first difference and each seasonal
 * index the mean of its phase minus the overall mean. Each later observation advances the
 * state through step(), which returns a new state instead of mutating a shared one.
 * Forecasts are floored at zero.
 */
class HoltWinters : public IForecaster {
public:
	explicit HoltWinters(HoltWintersConfig config = {});

	void fit(const core::DemandSeries &series) override;
	void fit(const std::vector<double> &values);

	/**
	 * @throws std::runtime_error If called before fit.
	 * @throws std::invalid_argument If horizon is negative.
	 */
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "HoltWinters";
	}

	/// Initial state for @p values under @p config.
	static HoltWintersState initialize(const std::vector<double> &values, const HoltWintersConfig &config);

	/// Advances @p state by observation @p value at position @p t.
	static HoltWintersState step(const HoltWintersState &state, double value, std::size_t t,
	                             const HoltWintersConfig &config);

	const HoltWintersConfig &config() const {
		return config_;
	}

	const HoltWintersState &state() const {
		return state_;
	}

	/// True when the last fit had too little history and fell back to the mean.
	bool degraded() const {
		return degraded_;
	}

private:
	HoltWintersConfig config_;
	HoltWintersState state_;
	std::size_t history_size_ = 0;
	double fallback_mean_ = 0.0;
	bool degraded_ = false;
	bool is_fitted_ = false;
};

} // namespace demandcast::models
