#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace planner::runtime::config {
class RuntimeConfig;
}

namespace planner::observability {

/*
  Structured log field, rendered as key=value after the message.
  Values containing whitespace or quotes are rendered quoted.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Daemon logging: colored stdout sink configured from RuntimeConfig and env.
void InitializeLogging(const planner::runtime::config::RuntimeConfig& config);

// Tool logging: stderr sink so stdout stays free for command output.
void InitializeToolLogging(std::string_view level);

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

} // namespace planner::observability

#define PLANNER_LOG_DEBUG(message, ...) ::planner::observability::LogDebug((message), ##__VA_ARGS__)
#define PLANNER_LOG_INFO(message, ...) ::planner::observability::LogInfo((message), ##__VA_ARGS__)
#define PLANNER_LOG_WARN(message, ...) ::planner::observability::LogWarn((message), ##__VA_ARGS__)
#define PLANNER_LOG_ERROR(message, ...) ::planner::observability::LogError((message), ##__VA_ARGS__)
