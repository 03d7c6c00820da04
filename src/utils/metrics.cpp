#include "demand-cast/utils/metrics.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace demandcast::utils {

namespace {

struct ErrorSums {
	double absolute = 0.0;
	double squared = 0.0;
	double percentage = 0.0;
	std::size_t percentage_days = 0;
	std::size_t n = 0;
};

ErrorSums accumulateErrors(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty() || actual.size() != predicted.size()) {
		throw std::invalid_argument("Metrics need non-empty actual and predicted vectors of equal length, got " +
		                            std::to_string(actual.size()) + " and " + std::to_string(predicted.size()) +
		                            ".");
	}

	ErrorSums sums;
	sums.n = actual.size();
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double error = actual[i] - predicted[i];
		sums.absolute += std::abs(error);
		sums.squared += error * error;
		if (std::abs(actual[i]) > std::numeric_limits<double>::epsilon()) {
			sums.percentage += std::abs(error / actual[i]);
			++sums.percentage_days;
		}
	}
	return sums;
}

std::optional<double> mapeFrom(const ErrorSums &sums) {
	if (sums.percentage_days == 0) {
		return std::nullopt;
	}
	return 100.0 * sums.percentage / static_cast<double>(sums.percentage_days);
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto sums = accumulateErrors(actual, predicted);
	return sums.absolute / static_cast<double>(sums.n);
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto sums = accumulateErrors(actual, predicted);
	return sums.squared / static_cast<double>(sums.n);
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return mapeFrom(accumulateErrors(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto sums = accumulateErrors(actual, predicted);
	// Population variance times n is the total sum of squares.
	const double total = stats::variance(actual) * static_cast<double>(sums.n);
	if (!std::isfinite(total) || total < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return 1.0 - sums.squared / total;
}

AccuracyMetrics Metrics::all(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto sums = accumulateErrors(actual, predicted);
	AccuracyMetrics metrics;
	metrics.n = sums.n;
	metrics.mae = sums.absolute / static_cast<double>(sums.n);
	metrics.mse = sums.squared / static_cast<double>(sums.n);
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.mape = mapeFrom(sums);
	metrics.r_squared = r2(actual, predicted);
	return metrics;
}

double Metrics::accuracy(const std::optional<double> &mape_percent, double fallback_mape, double floor) {
	const double mape_fraction = mape_percent ? *mape_percent / 100.0 : fallback_mape;
	return std::max(floor, 1.0 - mape_fraction);
}

} // namespace demandcast::utils
