#include "demand-cast/trend/trend_analyzer.hpp"
#include "demand-cast/utils/logging.hpp"
#include "demand-cast/utils/metrics.hpp"
#include "demand-cast/utils/statistics.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>

namespace demandcast::trend {

std::string toString(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::Increasing:
		return "increasing";
	case TrendDirection::Decreasing:
		return "decreasing";
	case TrendDirection::Stable:
		return "stable";
	}
	return "stable";
}

TrendAnalyzer::TrendAnalyzer(std::size_t min_samples, double significance)
    : min_samples_(min_samples), significance_(significance) {
	if (min_samples_ < 3) {
		throw std::invalid_argument("TrendAnalyzer needs at least 3 samples to fit a line.");
	}
	if (!(significance_ > 0.0 && significance_ < 1.0)) {
		throw std::invalid_argument("Significance level must be in (0, 1).");
	}
}

TrendAnalyzer::Builder &TrendAnalyzer::Builder::minSamples(std::size_t value) {
	min_samples_ = value;
	return *this;
}

TrendAnalyzer::Builder &TrendAnalyzer::Builder::significance(double value) {
	significance_ = value;
	return *this;
}

TrendAnalyzer TrendAnalyzer::Builder::build() const {
	return TrendAnalyzer(min_samples_, significance_);
}

TrendAnalyzer::Builder TrendAnalyzer::builder() {
	return Builder();
}

MannKendallResult TrendAnalyzer::mannKendall(const std::vector<double> &values) {
	MannKendallResult result;
	const std::size_t n = values.size();
	if (n < 2) {
		return result;
	}

	for (std::size_t i = 0; i + 1 < n; ++i) {
		for (std::size_t j = i + 1; j < n; ++j) {
			const double diff = values[j] - values[i];
			if (diff > 0.0) {
				result.s += 1.0;
			} else if (diff < 0.0) {
				result.s -= 1.0;
			}
		}
	}

	const double nd = static_cast<double>(n);
	result.variance = nd * (nd - 1.0) * (2.0 * nd + 5.0) / 18.0;
	result.z = result.s / std::sqrt(result.variance);
	result.p_value = 2.0 * (1.0 - utils::stats::normalCdf(std::abs(result.z)));
	return result;
}

TrendResult TrendAnalyzer::analyze(const core::DemandSeries &series) const {
	return analyze(series.values());
}

TrendResult TrendAnalyzer::analyze(const std::vector<double> &values) const {
	TrendResult result;
	const std::size_t n = values.size();
	if (n < min_samples_) {
		DEMANDCAST_DEBUG("TrendAnalyzer needs {} points, got {}. Reporting a stable trend.", min_samples_, n);
		result.intercept = utils::stats::mean(values);
		return result;
	}

	Eigen::MatrixXd X(n, 2);
	Eigen::VectorXd y(n);
	for (std::size_t i = 0; i < n; ++i) {
		X(static_cast<Eigen::Index>(i), 0) = 1.0;
		X(static_cast<Eigen::Index>(i), 1) = static_cast<double>(i);
		y(static_cast<Eigen::Index>(i)) = values[i];
	}
	const Eigen::VectorXd beta = X.colPivHouseholderQr().solve(y);
	const Eigen::VectorXd fitted_eigen = X * beta;

	result.intercept = beta(0);
	result.slope = beta(1);
	if (std::abs(result.slope) < 1e-12) {
		result.slope = 0.0;
	}

	const std::vector<double> fitted(fitted_eigen.data(), fitted_eigen.data() + fitted_eigen.size());
	result.r_squared = utils::Metrics::r2(values, fitted).value_or(0.0);

	const auto mk = mannKendall(values);
	result.p_value = mk.p_value;
	result.confidence = result.r_squared * (1.0 - result.p_value);

	if (result.p_value < significance_) {
		if (result.slope > 0.0) {
			result.direction = TrendDirection::Increasing;
		} else if (result.slope < 0.0) {
			result.direction = TrendDirection::Decreasing;
		}
	}
	result.status = core::DataStatus::Sufficient;

	DEMANDCAST_DEBUG("Trend {}: slope {:.4f}, r2 {:.3f}, p {:.4f}.", toString(result.direction), result.slope,
	                 result.r_squared, result.p_value);
	return result;
}

} // namespace demandcast::trend
