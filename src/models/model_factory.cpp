#include "demand-cast/models/model_factory.hpp"
#include "demand-cast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace demandcast::models {

namespace {

std::string lowercase(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

// Models that are trained outside the engine.
const std::vector<std::string> &externalModels() {
	static const std::vector<std::string> names = {"arima", "prophet", "xgboost", "linear_regression"};
	return names;
}

} // namespace

std::string toString(ModelType type) {
	switch (type) {
	case ModelType::HoltWinters:
		return "holt_winters";
	}
	return "unknown";
}

std::unique_ptr<IForecaster> ModelFactory::create(ModelType type, const HoltWintersConfig &config) {
	switch (type) {
	case ModelType::HoltWinters:
		return std::make_unique<HoltWinters>(config);
	}
	throw std::invalid_argument("Unsupported model type.");
}

std::unique_ptr<IForecaster> ModelFactory::create(const std::string &model_name, const HoltWintersConfig &config) {
	const std::string name = lowercase(model_name);
	if (name == "holt_winters" || name == "holtwinters") {
		return create(ModelType::HoltWinters, config);
	}

	const auto &external = externalModels();
	if (std::find(external.begin(), external.end(), name) != external.end()) {
		DEMANDCAST_WARN("Model '{}' is trained outside the engine and cannot be created here.", model_name);
		throw std::invalid_argument("Model '" + model_name + "' is not available in-process.");
	}

	const auto supported_models = getSupportedModels();
	std::string supported_list;
	for (std::size_t i = 0; i < supported_models.size(); i++) {
		if (i > 0)
			supported_list += ", ";
		supported_list += supported_models[i];
	}
	throw std::invalid_argument("Unknown model: '" + model_name + "'. Supported models: " + supported_list);
}

std::vector<std::string> ModelFactory::getSupportedModels() {
	return {toString(ModelType::HoltWinters)};
}

} // namespace demandcast::models
