#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace aff4::observability {
namespace {

std::string ResolveLevel(const aff4::store::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("AFF4_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const aff4::store::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("AFF4_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const aff4::store::config::RuntimeConfig& config) {
  auto logger = spdlog::get("aff4-store");
  if (!logger) {
    logger = spdlog::stdout_color_mt("aff4-store");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace aff4::observability
