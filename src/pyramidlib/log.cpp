#include "log.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> Log::logger;

void Log::init(spdlog::level::level_enum log_level) {
	spdlog::set_pattern("[%Y-%m-%d %T.%e] [%=3n] [%^%l%$] %v");
	// worker threads log concurrently, the _mt sink serialises them.
	spdlog::drop("LOG");
	Log::logger = spdlog::stderr_color_mt("LOG");
	Log::logger->set_level(log_level);
}
