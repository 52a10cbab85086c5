#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace netmap {
namespace log {

namespace {

const char* kLoggerName = "netmap";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("NETMAP_LOG_LEVEL")) {
        return level;
    }
    if (!config.level.empty()) {
        return config.level;
    }
    return "info";
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("NETMAP_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string serialize_fields(std::initializer_list<Field> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) out << ' ';
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

Field StringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

Field IntField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

Field DoubleField(std::string_view key, double value) {
    std::ostringstream ss;
    ss << std::setprecision(4) << value;
    return {std::string(key), ss.str()};
}

Field BoolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const LoggingConfig& config) {
    spdlog::drop(kLoggerName);
    auto logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void write(spdlog::level::level_enum level, std::string_view message,
           std::initializer_list<Field> fields) {
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

} // namespace log
} // namespace netmap
