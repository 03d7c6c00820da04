#pragma once

#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/forecast.hpp"
#include "demand-cast/utils/metrics.hpp"
#include <string>
#include <vector>

namespace demandcast::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * Defines the common API used by the backtester and the orchestrator: fit on a daily
 * demand series, then predict a number of future days.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided series.
	 * @param series The demand history to train the model on.
	 */
	virtual void fit(const core::DemandSeries &series) = 0;

	/**
	 * @brief Generates forecasts for a specified number of days after the fitted history.
	 * @param horizon The number of future days to predict.
	 * @return A Forecast object containing the point predictions.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief Evaluates accuracy metrics against provided actual values.
	 */
	virtual utils::AccuracyMetrics score(const std::vector<double> &actual, const std::vector<double> &predicted) const {
		return utils::Metrics::all(actual, predicted);
	}

	virtual std::string getName() const = 0;
};

} // namespace demandcast::models
