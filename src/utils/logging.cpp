#include "demand-cast/utils/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace demandcast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {
std::once_flag logger_created;
} // namespace

void Logging::init(spdlog::level::level_enum level) {
	auto &logger = getLogger();
	logger->set_level(level);
	logger->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Forecasts for different products may run on separate threads; create the sink exactly once.
	std::call_once(logger_created, [] {
		logger_ = spdlog::get("demand-cast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("demand-cast");
		}
		logger_->set_level(spdlog::level::info);
		logger_->flush_on(spdlog::level::info);
	});
	return logger_;
}

} // namespace demandcast::utils
