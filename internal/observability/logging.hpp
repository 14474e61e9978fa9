#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace artifact::runtime::config {
class RuntimeConfig;
}

namespace artifact::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Command line tools log to stderr so stdout stays machine readable.
enum class LogTarget { kStdout, kStderr };

void InitializeLogging(const artifact::runtime::config::RuntimeConfig& config, LogTarget target = LogTarget::kStdout);
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

} // namespace artifact::observability

#define ARTIFACT_LOG_DEBUG(message, ...) ::artifact::observability::LogDebug((message), ##__VA_ARGS__)
#define ARTIFACT_LOG_INFO(message, ...) ::artifact::observability::LogInfo((message), ##__VA_ARGS__)
#define ARTIFACT_LOG_WARN(message, ...) ::artifact::observability::LogWarn((message), ##__VA_ARGS__)
#define ARTIFACT_LOG_ERROR(message, ...) ::artifact::observability::LogError((message), ##__VA_ARGS__)
