#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace demandcast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the engine logs through the same logger, which can be
 * configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace demandcast::utils

// --- Logger Macros for convenient access ---
#define DEMANDCAST_TRACE(...)    demandcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DEMANDCAST_DEBUG(...)    demandcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DEMANDCAST_INFO(...)     demandcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DEMANDCAST_WARN(...)     demandcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DEMANDCAST_ERROR(...)    demandcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DEMANDCAST_CRITICAL(...) demandcast::utils::Logging::getLogger()->critical(__VA_ARGS__)
