#include "demand-cast/detectors/iqr.hpp"
#include "demand-cast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandcast::detectors {

// --- Detector Implementation ---

IQRDetector::IQRDetector(double multiplier, std::size_t min_samples, bool until_stable)
    : multiplier_(multiplier), min_samples_(min_samples), until_stable_(until_stable) {
	if (!(multiplier_ >= 0.0) || !std::isfinite(multiplier_)) {
		throw std::invalid_argument("IQR multiplier must be a non-negative finite number.");
	}
	if (min_samples_ == 0) {
		throw std::invalid_argument("IQR minimum sample count must be positive.");
	}
}

OutlierResult IQRDetector::detect(const core::DemandSeries &series) const {
	OutlierResult result;
	if (series.size() < min_samples_) {
		DEMANDCAST_DEBUG("IQRDetector needs {} points, got {}. Returning no outliers.", min_samples_, series.size());
		return result;
	}

	std::vector<double> sorted = series.values();
	std::sort(sorted.begin(), sorted.end());

	const std::size_t n = sorted.size();
	const double q1 = sorted[static_cast<std::size_t>(std::floor(static_cast<double>(n) * 0.25))];
	const double q3 = sorted[static_cast<std::size_t>(std::floor(static_cast<double>(n) * 0.75))];
	const double iqr = q3 - q1;

	result.lower_fence = q1 - multiplier_ * iqr;
	result.upper_fence = q3 + multiplier_ * iqr;

	for (std::size_t i = 0; i < series.size(); ++i) {
		const double v = series[i].value;
		if (v < result.lower_fence || v > result.upper_fence) {
			result.outlier_indices.push_back(i);
		}
	}
	return result;
}

core::CleanedSeries IQRDetector::removeOnce(const core::DemandSeries &series, std::size_t &removed) const {
	const auto outliers = detect(series);
	removed = outliers.outlier_indices.size();
	if (removed == 0) {
		return series;
	}

	std::vector<core::DailyObservation> kept;
	kept.reserve(series.size() - removed);
	auto next_outlier = outliers.outlier_indices.begin();
	for (std::size_t i = 0; i < series.size(); ++i) {
		if (next_outlier != outliers.outlier_indices.end() && *next_outlier == i) {
			++next_outlier;
			continue;
		}
		kept.push_back(series[i]);
	}
	return core::CleanedSeries(std::move(kept));
}

core::CleanedSeries IQRDetector::filter(const core::RawSeries &series) const {
	std::size_t removed = 0;
	core::CleanedSeries cleaned = removeOnce(series, removed);
	std::size_t total_removed = removed;

	while (until_stable_ && removed > 0) {
		cleaned = removeOnce(cleaned, removed);
		total_removed += removed;
	}

	if (total_removed > 0) {
		DEMANDCAST_DEBUG("IQRDetector removed {} of {} observations.", total_removed, series.size());
	}
	return cleaned;
}

// --- Builder Implementation ---

IQRDetectorBuilder &IQRDetectorBuilder::withMultiplier(double multiplier) {
	multiplier_ = multiplier;
	return *this;
}

IQRDetectorBuilder &IQRDetectorBuilder::minSamples(std::size_t min_samples) {
	min_samples_ = min_samples;
	return *this;
}

IQRDetectorBuilder &IQRDetectorBuilder::untilStable(bool enabled) {
	until_stable_ = enabled;
	return *this;
}

std::unique_ptr<IQRDetector> IQRDetectorBuilder::build() {
	DEMANDCAST_DEBUG("Building IQRDetector with multiplier {} (min samples {}).", multiplier_, min_samples_);
	return std::unique_ptr<IQRDetector>(new IQRDetector(multiplier_, min_samples_, until_stable_));
}

} // namespace demandcast::detectors
