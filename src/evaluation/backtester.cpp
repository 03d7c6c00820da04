#include "demand-cast/evaluation/backtester.hpp"
#include "demand-cast/utils/logging.hpp"
#include "demand-cast/utils/metrics.hpp"

#include <algorithm>
#include <stdexcept>

namespace demandcast::evaluation {

void BacktestConfig::validate() const {
	if (horizon <= 0) {
		throw std::invalid_argument("Backtest horizon must be positive.");
	}
	if (max_windows <= 0) {
		throw std::invalid_argument("Backtest window count must be positive.");
	}
	if (!(min_accuracy > 0.0 && min_accuracy <= 1.0) || !(default_accuracy > 0.0 && default_accuracy <= 1.0)) {
		throw std::invalid_argument("Backtest accuracies must be in (0, 1].");
	}
	if (!(default_mape >= 0.0)) {
		throw std::invalid_argument("Default MAPE must be non-negative.");
	}
}

Backtester::Backtester(BacktestConfig config) : config_(config) {
	config_.validate();
}

std::vector<std::tuple<int, int, int, int>> Backtester::generateWindows(int n_samples, const BacktestConfig &config) {
	std::vector<std::tuple<int, int, int, int>> windows;
	const int h = config.horizon;
	if (h <= 0 || n_samples < 2 * h) {
		return windows;
	}

	const int count = std::min(config.max_windows, n_samples / h - 1);
	for (int k = 1; k <= count; ++k) {
		const int test_start = n_samples - k * h;
		const int test_end = test_start + h;
		windows.emplace_back(0, test_start, test_start, test_end);
	}
	return windows;
}

BacktestResult Backtester::evaluate(const core::DemandSeries &series, const ModelFactory &model_factory) const {
	BacktestResult result;
	result.accuracy = config_.default_accuracy;
	result.mape = config_.default_mape;

	const int n = static_cast<int>(series.size());
	const auto windows = generateWindows(n, config_);
	if (windows.empty()) {
		DEMANDCAST_INFO("Backtest needs {} days of history, got {}. Reporting default accuracy {:.2f}.",
		                2 * config_.horizon, n, config_.default_accuracy);
		return result;
	}

	const auto values = series.values();
	std::vector<double> all_actuals;
	std::vector<double> all_forecasts;

	for (std::size_t w = 0; w < windows.size(); ++w) {
		const auto &[train_start, train_end, test_start, test_end] = windows[w];

		auto model = model_factory();
		if (!model) {
			throw std::runtime_error("Backtest model factory returned no model.");
		}
		model->fit(series.slice(static_cast<std::size_t>(train_start), static_cast<std::size_t>(train_end)));
		const auto forecast = model->predict(test_end - test_start);

		BacktestWindow window;
		window.window_id = static_cast<int>(w) + 1;
		window.train_end = train_end;
		window.test_start = test_start;
		window.test_end = test_end;
		window.actuals.assign(values.begin() + test_start, values.begin() + test_end);
		window.forecasts = forecast.point;

		const auto metrics = model->score(window.actuals, window.forecasts);
		window.mae = metrics.mae;
		window.rmse = metrics.rmse;
		if (metrics.mape) {
			window.mape = *metrics.mape / 100.0;
		}

		all_actuals.insert(all_actuals.end(), window.actuals.begin(), window.actuals.end());
		all_forecasts.insert(all_forecasts.end(), window.forecasts.begin(), window.forecasts.end());
		result.windows.push_back(std::move(window));
	}

	const auto pooled = utils::Metrics::all(all_actuals, all_forecasts);
	result.mae = pooled.mae;
	result.rmse = pooled.rmse;
	result.mape = pooled.mape ? *pooled.mape / 100.0 : config_.default_mape;
	result.accuracy = utils::Metrics::accuracy(pooled.mape, config_.default_mape, config_.min_accuracy);
	result.samples_tested = all_actuals.size();
	result.status = core::DataStatus::Sufficient;

	DEMANDCAST_DEBUG("Backtest over {} windows ({} samples): accuracy {:.3f}, mape {:.3f}.", result.windows.size(),
	                 result.samples_tested, result.accuracy, result.mape);
	return result;
}

} // namespace demandcast::evaluation
