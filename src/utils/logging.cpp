#include "thermocast/utils/logging.hpp"

#ifndef THERMOCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace thermocast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("thermocast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("thermocast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace thermocast::utils

#endif // THERMOCAST_NO_LOGGING
