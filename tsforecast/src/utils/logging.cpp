#include "tsforecast/utils/logging.hpp"

#ifndef TSFORECAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tsforecast::utils {

namespace {

constexpr const char *kLoggerName = "tsforecast";

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;
std::once_flag Logging::create_once_;

void Logging::ensureLogger() {
	std::call_once(create_once_, []() {
		logger_ = spdlog::get(kLoggerName);
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt(kLoggerName);
			logger_->set_pattern(kPattern);
			logger_->set_level(spdlog::level::info);
			logger_->flush_on(spdlog::level::info);
		}
	});
}

void Logging::init(spdlog::level::level_enum level) {
	ensureLogger();
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	ensureLogger();
	return logger_;
}

std::optional<spdlog::level::level_enum> Logging::parseLevel(const std::string &name) {
	// from_str maps unknown names to "off"; only accept "off" when asked for.
	const auto level = spdlog::level::from_str(name);
	if (level == spdlog::level::off && name != "off") {
		return std::nullopt;
	}
	return level;
}

} // namespace tsforecast::utils

#endif // TSFORECAST_NO_LOGGING
