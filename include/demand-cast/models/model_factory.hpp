#pragma once

#include "demand-cast/models/holt_winters.hpp"
#include "demand-cast/models/iforecaster.hpp"
#include <memory>
#include <string>
#include <vector>

namespace demandcast::models {

/// Forecasting models the engine can run in-process.
enum class ModelType { HoltWinters };

std::string toString(ModelType type);

class ModelFactory {
public:
	static std::unique_ptr<IForecaster> create(ModelType type, const HoltWintersConfig &config = {});

	/**
	 * @brief Creates a forecaster from its name (case-insensitive).
	 * @throws std::invalid_argument For externally trained models (arima, prophet, xgboost,
	 *         linear_regression) and unknown names.
	 */
	static std::unique_ptr<IForecaster> create(const std::string &model_name, const HoltWintersConfig &config = {});

	static std::vector<std::string> getSupportedModels();
};

} // namespace demandcast::models
