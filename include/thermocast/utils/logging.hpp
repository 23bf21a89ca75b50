#pragma once

#ifndef THERMOCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace thermocast::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the library's spdlog logger.
 *
 * The logger is created lazily on first use with level @c info. Call init()
 * at startup to change the level; repeated calls reuse the same logger.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger instance, creating it if needed.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if needed and sets its level and flush level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace thermocast::utils

#define THERMOCAST_TRACE(...)    thermocast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define THERMOCAST_DEBUG(...)    thermocast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define THERMOCAST_INFO(...)     thermocast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define THERMOCAST_WARN(...)     thermocast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define THERMOCAST_ERROR(...)    thermocast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define THERMOCAST_CRITICAL(...) thermocast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace thermocast::utils {

class Logging {
public:
	static void init() {}
};

} // namespace thermocast::utils

#define THERMOCAST_TRACE(...)    do {} while(0)
#define THERMOCAST_DEBUG(...)    do {} while(0)
#define THERMOCAST_INFO(...)     do {} while(0)
#define THERMOCAST_WARN(...)     do {} while(0)
#define THERMOCAST_ERROR(...)    do {} while(0)
#define THERMOCAST_CRITICAL(...) do {} while(0)

#endif // THERMOCAST_NO_LOGGING
