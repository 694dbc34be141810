#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace scidata::logging {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Install the "scidata" logger. SCIDATA_LOG_LEVEL and SCIDATA_LOG_PATTERN
// override the arguments.
void InitializeLogging(std::string_view level = "info", std::string_view pattern = {});
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

} // namespace scidata::logging

#define SCIDATA_LOG_DEBUG(message, ...) ::scidata::logging::LogDebug((message), ##__VA_ARGS__)
#define SCIDATA_LOG_INFO(message, ...) ::scidata::logging::LogInfo((message), ##__VA_ARGS__)
#define SCIDATA_LOG_WARN(message, ...) ::scidata::logging::LogWarn((message), ##__VA_ARGS__)
#define SCIDATA_LOG_ERROR(message, ...) ::scidata::logging::LogError((message), ##__VA_ARGS__)
