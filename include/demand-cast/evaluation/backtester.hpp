#pragma once

#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/errors.hpp"
#include "demand-cast/models/iforecaster.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <vector>

namespace demandcast::evaluation {

/**
 * @brief Configuration for walk-forward backtesting
 */
struct BacktestConfig {
	int horizon = 30;               // Size of each held-out window
	int max_windows = 5;            // Trailing windows evaluated at most
	double min_accuracy = 0.1;      // Floor of 1 - mape
	double default_accuracy = 0.75; // Reported when history < 2 * horizon
	double default_mape = 0.25;     // Also used when every actual is zero

	void validate() const;
};

/**
 * @brief Results from a single held-out window
 */
struct BacktestWindow {
	int window_id = 0;
	int train_end = 0;  // Training data is [0, train_end)
	int test_start = 0;
	int test_end = 0;   // exclusive

	std::vector<double> forecasts;
	std::vector<double> actuals;

	double mae = 0.0;
	double rmse = 0.0;
	std::optional<double> mape; // fraction, not percent
};

struct BacktestResult {
	double accuracy = 0.75;
	double mape = 0.25; // fraction
	double rmse = 0.0;
	double mae = 0.0;
	std::size_t samples_tested = 0;
	std::vector<BacktestWindow> windows;
	core::DataStatus status = core::DataStatus::InsufficientData;
};

/**
 * @brief Walk-forward evaluation over non-overlapping trailing windows
 */
class Backtester {
public:
	using ModelFactory = std::function<std::unique_ptr<models::IForecaster>()>;

	explicit Backtester(BacktestConfig config = {});

	/**
	 * @brief Evaluates a freshly created model on each trailing window
	 *
	 * Window k (1-based) tests [n - k*h, n - (k-1)*h) and trains on everything before it.
	 * Errors are pooled across windows. Zero actuals are skipped for MAPE.
	 */
	BacktestResult evaluate(const core::DemandSeries &series, const ModelFactory &model_factory) const;

	/**
	 * @brief Generate window indices, most recent first
	 * @return Vector of (train_start, train_end, test_start, test_end) tuples
	 */
	static std::vector<std::tuple<int, int, int, int>> generateWindows(int n_samples, const BacktestConfig &config);

	const BacktestConfig &config() const {
		return config_;
	}

private:
	BacktestConfig config_;
};

} // namespace demandcast::evaluation
