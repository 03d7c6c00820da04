#pragma once

#include <cstddef>
#include <vector>

namespace demandcast::evaluation {

struct Interval {
	double lower = 0.0;
	double upper = 0.0;

	double width() const {
		return upper - lower;
	}
};

/**
 * @class ConfidenceIntervalEstimator
 * @brief Symmetric bands from the historical spread that widen along the horizon.
 *
 * margin_i = z * stddev(history) * (1 + (i / horizon) * widening). The lower bound is
 * floored at zero.
 */
class ConfidenceIntervalEstimator {
public:
	/**
	 * @throws std::invalid_argument Unless 0 < confidence_level < 1 and widening >= 0.
	 */
	explicit ConfidenceIntervalEstimator(double confidence_level = 0.95, double widening = 0.5);

	/// Two-sided normal critical value for the configured level.
	double zScore() const {
		return z_;
	}

	double confidenceLevel() const {
		return confidence_level_;
	}

	double margin(double history_stddev, std::size_t day_index, std::size_t horizon) const;

	Interval interval(double predicted, double history_stddev, std::size_t day_index, std::size_t horizon) const;

	/// One interval per prediction, with the spread taken from @p history.
	std::vector<Interval> estimate(const std::vector<double> &predicted, const std::vector<double> &history) const;

private:
	double confidence_level_;
	double widening_;
	double z_;
};

} // namespace demandcast::evaluation
