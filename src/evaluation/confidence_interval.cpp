#include "demand-cast/evaluation/confidence_interval.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <algorithm>
#include <stdexcept>

namespace demandcast::evaluation {

ConfidenceIntervalEstimator::ConfidenceIntervalEstimator(double confidence_level, double widening)
    : confidence_level_(confidence_level), widening_(widening) {
	if (!(confidence_level_ > 0.0 && confidence_level_ < 1.0)) {
		throw std::invalid_argument("Confidence level must be in (0, 1).");
	}
	if (!(widening_ >= 0.0)) {
		throw std::invalid_argument("Interval widening must be non-negative.");
	}
	z_ = utils::stats::normalQuantile(1.0 - (1.0 - confidence_level_) / 2.0);
}

double ConfidenceIntervalEstimator::margin(double history_stddev, std::size_t day_index, std::size_t horizon) const {
	const double progress = horizon > 0 ? static_cast<double>(day_index) / static_cast<double>(horizon) : 0.0;
	return z_ * history_stddev * (1.0 + progress * widening_);
}

Interval ConfidenceIntervalEstimator::interval(double predicted, double history_stddev, std::size_t day_index,
                                               std::size_t horizon) const {
	const double m = margin(history_stddev, day_index, horizon);
	Interval result;
	result.lower = std::max(0.0, predicted - m);
	result.upper = std::max(result.lower, predicted + m);
	return result;
}

std::vector<Interval> ConfidenceIntervalEstimator::estimate(const std::vector<double> &predicted,
                                                            const std::vector<double> &history) const {
	const double spread = utils::stats::stdDev(history);
	std::vector<Interval> intervals;
	intervals.reserve(predicted.size());
	for (std::size_t i = 0; i < predicted.size(); ++i) {
		intervals.push_back(interval(predicted[i], spread, i, predicted.size()));
	}
	return intervals;
}

} // namespace demandcast::evaluation
