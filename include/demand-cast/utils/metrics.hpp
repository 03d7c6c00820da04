#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace demandcast::utils {

/// Forecast error statistics over aligned actual / predicted demand.
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	/// Percent. Days with zero actual demand are left out.
	std::optional<double> mape;
	std::optional<double> r_squared;
	std::size_t n = 0;
};

/**
 * @class Metrics
 * @brief Error statistics shared by model scoring and backtesting.
 *
 * Every function throws std::invalid_argument unless both vectors are non-empty and of
 * equal length.
 */
class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Mean absolute percentage error in percent; nullopt when every actual is zero.
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Coefficient of determination; nullopt when the actuals have no variance.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	static AccuracyMetrics all(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Accuracy as 1 - MAPE, both as fractions, never below @p floor.
	 *
	 * A missing MAPE is replaced by @p fallback_mape first.
	 */
	static double accuracy(const std::optional<double> &mape_percent, double fallback_mape, double floor);
};

} // namespace demandcast::utils
