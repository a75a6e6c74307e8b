#pragma once

#ifndef TSFORECAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tsforecast::utils {

/**
 * @class Logging
 * @brief The "tsforecast" spdlog logger shared by every pipeline stage.
 *
 * Messages go to stderr so that stdout stays free for JSON responses.
 */
class Logging {
public:
	/// Line layout: time, level, message.
	static constexpr const char *kPattern = "[%H:%M:%S.%e] [%^%l%$] %v";

	/**
	 * @brief Gets the shared logger, creating it at info level on first use.
	 *
	 * Safe to call from several threads at once.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates or adopts the logger and sets its level and flush level.
	 *
	 * A logger already registered with spdlog under "tsforecast" is reused,
	 * so a host process can route output through its own sinks.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/// Level for a command-line name ("trace" ... "critical", "off"); std::nullopt when unknown.
	static std::optional<spdlog::level::level_enum> parseLevel(const std::string &name);

private:
	Logging() = default;

	static void ensureLogger();

	static std::shared_ptr<spdlog::logger> logger_;
	static std::once_flag create_once_;
};

} // namespace tsforecast::utils

#define TSFORECAST_TRACE(...)    tsforecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TSFORECAST_DEBUG(...)    tsforecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TSFORECAST_INFO(...)     tsforecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TSFORECAST_WARN(...)     tsforecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TSFORECAST_ERROR(...)    tsforecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TSFORECAST_CRITICAL(...) tsforecast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace tsforecast::utils {

class Logging {
public:
	static void init() {}
};

} // namespace tsforecast::utils

#define TSFORECAST_TRACE(...)    do {} while(0)
#define TSFORECAST_DEBUG(...)    do {} while(0)
#define TSFORECAST_INFO(...)     do {} while(0)
#define TSFORECAST_WARN(...)     do {} while(0)
#define TSFORECAST_ERROR(...)    do {} while(0)
#define TSFORECAST_CRITICAL(...) do {} while(0)

#endif // TSFORECAST_NO_LOGGING
