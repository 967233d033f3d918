#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace calltrace::runtime::config {
class RuntimeConfig;
}

namespace calltrace::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const calltrace::runtime::config::RuntimeConfig& config);
void FlushLogging();
// No logging may happen after this.
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

} // namespace calltrace::observability

#define CALLTRACE_LOG_DEBUG(message, ...) ::calltrace::observability::LogDebug((message), ##__VA_ARGS__)
#define CALLTRACE_LOG_INFO(message, ...) ::calltrace::observability::LogInfo((message), ##__VA_ARGS__)
#define CALLTRACE_LOG_WARN(message, ...) ::calltrace::observability::LogWarn((message), ##__VA_ARGS__)
#define CALLTRACE_LOG_ERROR(message, ...) ::calltrace::observability::LogError((message), ##__VA_ARGS__)
