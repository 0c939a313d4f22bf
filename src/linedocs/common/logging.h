#ifndef LINEDOCS_COMMON_LOGGING_H
#define LINEDOCS_COMMON_LOGGING_H

// Library-internal logging. Messages use fmt-style "{}" placeholders and are
// compiled out below SPDLOG_ACTIVE_LEVEL (set from LINEDOCS_LOGGER_LEVEL).
#include <linedocs/utils/logger.h>
#include <spdlog/spdlog.h>

#define LINEDOCS_LOGGER_INIT() linedocs::logger::init_from_environment()

#define LINEDOCS_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LINEDOCS_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LINEDOCS_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LINEDOCS_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LINEDOCS_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

#endif  // LINEDOCS_COMMON_LOGGING_H
