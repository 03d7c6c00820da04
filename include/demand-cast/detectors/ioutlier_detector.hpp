#pragma once

#include "demand-cast/core/demand_series.hpp"
#include <string>
#include <vector>

namespace demandcast::detectors {

/**
 * @struct OutlierResult
 * @brief Holds the results of an outlier detection operation.
 */
struct OutlierResult {
	/// Positions of the outliers in the analysed series, ascending.
	std::vector<std::size_t> outlier_indices;

	/// Fences the decision was made against; equal when the detector declined to act.
	double lower_fence = 0.0;
	double upper_fence = 0.0;
};

/**
 * @class IOutlierDetector
 * @brief An interface for all outlier detection algorithms.
 */
class IOutlierDetector {
public:
	virtual ~IOutlierDetector() = default;

	/**
	 * @brief Detects outliers in the given demand series.
	 * @param series The series to analyze.
	 * @return An OutlierResult object containing the indices of detected outliers.
	 */
	virtual OutlierResult detect(const core::DemandSeries &series) const = 0;

	/**
	 * @brief Gets the name of the outlier detector.
	 */
	virtual std::string getName() const = 0;
};

} // namespace demandcast::detectors
