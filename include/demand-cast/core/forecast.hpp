#pragma once

#include <cstddef>
#include <vector>

namespace demandcast::core {

/**
 * @struct Forecast
 * @brief Holds the point predictions of a forecaster, one per horizon step.
 *
 * Prediction intervals are built by the caller from the points (see
 * evaluation::ConfidenceIntervalEstimator).
 */
struct Forecast {
	using Series = std::vector<double>;

	Series point;

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}
};

} // namespace demandcast::core
