#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace localdisk::runtime::config {
class LoggingConfig;
}

namespace localdisk::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

void InitializeLogging(const localdisk::runtime::config::LoggingConfig& config);
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

} // namespace localdisk::observability

#define LOCALDISK_LOG_DEBUG(message, ...) ::localdisk::observability::LogDebug((message), ##__VA_ARGS__)
#define LOCALDISK_LOG_INFO(message, ...) ::localdisk::observability::LogInfo((message), ##__VA_ARGS__)
#define LOCALDISK_LOG_WARN(message, ...) ::localdisk::observability::LogWarn((message), ##__VA_ARGS__)
#define LOCALDISK_LOG_ERROR(message, ...) ::localdisk::observability::LogError((message), ##__VA_ARGS__)
