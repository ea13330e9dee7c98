#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace aff4::store::config {
class RuntimeConfig;
}

namespace aff4::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const aff4::store::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace aff4::observability

#define AFF4_LOG_DEBUG(message, ...) ::aff4::observability::LogDebug((message), ##__VA_ARGS__)
#define AFF4_LOG_INFO(message, ...) ::aff4::observability::LogInfo((message), ##__VA_ARGS__)
#define AFF4_LOG_WARN(message, ...) ::aff4::observability::LogWarn((message), ##__VA_ARGS__)
#define AFF4_LOG_ERROR(message, ...) ::aff4::observability::LogError((message), ##__VA_ARGS__)
