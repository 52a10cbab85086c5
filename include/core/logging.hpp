#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace netmap {

struct LoggingConfig;

namespace log {

struct Field {
    std::string key;
    std::string value;
};

Field StringField(std::string_view key, std::string_view value);
Field IntField(std::string_view key, std::int64_t value);
Field DoubleField(std::string_view key, double value);
Field BoolField(std::string_view key, bool value);

/**
 * @brief Install the process-wide logger
 *
 * NETMAP_LOG_LEVEL and NETMAP_LOG_PATTERN override the configured values.
 * Safe to call more than once; later calls replace the logger.
 */
void init_logging(const LoggingConfig& config);
void shutdown_logging();

void write(spdlog::level::level_enum level, std::string_view message,
           std::initializer_list<Field> fields = {});

inline void debug(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::debug, message, fields);
}

inline void info(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::info, message, fields);
}

inline void warn(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::warn, message, fields);
}

inline void error(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::err, message, fields);
}

} // namespace log
} // namespace netmap

#define NETMAP_LOG_DEBUG(message, ...) ::netmap::log::debug((message), ##__VA_ARGS__)
#define NETMAP_LOG_INFO(message, ...) ::netmap::log::info((message), ##__VA_ARGS__)
#define NETMAP_LOG_WARN(message, ...) ::netmap::log::warn((message), ##__VA_ARGS__)
#define NETMAP_LOG_ERROR(message, ...) ::netmap::log::error((message), ##__VA_ARGS__)
