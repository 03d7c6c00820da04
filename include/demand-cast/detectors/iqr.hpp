#pragma once

#include "demand-cast/detectors/ioutlier_detector.hpp"
#include <memory>

namespace demandcast::detectors {

class IQRDetectorBuilder; // Forward declaration

/**
 * @class IQRDetector
 * @brief Removes observations outside [Q1 - k*IQR, Q3 + k*IQR].
 *
 * Quartiles are read directly from the sorted values at positions floor(0.25 n) and
 * floor(0.75 n), without interpolation. Series shorter than the minimum sample count
 * pass through untouched.
 */
class IQRDetector final : public IOutlierDetector {
public:
	friend class IQRDetectorBuilder;

	OutlierResult detect(const core::DemandSeries &series) const override;

	/**
	 * @brief Returns the series without its outliers, survivors kept in date order.
	 *
	 * By default the pass repeats on its own output until nothing more is removed, so
	 * filtering the result again is a no-op. untilStable(false) makes a single pass.
	 */
	core::CleanedSeries filter(const core::RawSeries &series) const;

	std::string getName() const override {
		return "IQRDetector";
	}

private:
	IQRDetector(double multiplier, std::size_t min_samples, bool until_stable);

	core::CleanedSeries removeOnce(const core::DemandSeries &series, std::size_t &removed) const;

	double multiplier_;
	std::size_t min_samples_;
	bool until_stable_;
};

/**
 * @class IQRDetectorBuilder
 * @brief A builder for fluently configuring and creating IQRDetector instances.
 */
class IQRDetectorBuilder {
public:
	/// Fence width in IQRs. Must be non-negative.
	IQRDetectorBuilder &withMultiplier(double multiplier);

	/// Smallest series the filter acts on.
	IQRDetectorBuilder &minSamples(std::size_t min_samples);

	/// Repeat the pass until a fixed point is reached. On by default.
	IQRDetectorBuilder &untilStable(bool enabled = true);

	std::unique_ptr<IQRDetector> build();

private:
	double multiplier_ = 1.5;
	std::size_t min_samples_ = 4;
	bool until_stable_ = true;
};

} // namespace demandcast::detectors
