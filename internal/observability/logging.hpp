#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace alarmsrv::runtime::config {
class RuntimeConfig;
}

namespace alarmsrv::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Console sink always; file sink when logging.file is set.
void InitializeLogging(const alarmsrv::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Appends fields to the message as key=value pairs.
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

} // namespace alarmsrv::observability

#define ALARMSRV_LOG_DEBUG(message, ...) ::alarmsrv::observability::LogDebug((message), ##__VA_ARGS__)
#define ALARMSRV_LOG_INFO(message, ...) ::alarmsrv::observability::LogInfo((message), ##__VA_ARGS__)
#define ALARMSRV_LOG_WARN(message, ...) ::alarmsrv::observability::LogWarn((message), ##__VA_ARGS__)
#define ALARMSRV_LOG_ERROR(message, ...) ::alarmsrv::observability::LogError((message), ##__VA_ARGS__)
