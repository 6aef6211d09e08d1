#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace avatarpool::observability {
namespace {

constexpr const char* kLoggerName    = "avatar-pool";
constexpr const char* kDefaultPattern  = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevelName(const avatarpool::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("AVATARPOOL_LOG_LEVEL")) {
    return level;
  }
  return config.logging().level();
}

// spdlog::level::from_str maps unknown names to "off"; treat those as info.
bool ParseLevel(const std::string& name, spdlog::level::level_enum* level) {
  if (name.empty()) {
    *level = spdlog::level::info;
    return true;
  }
  *level = spdlog::level::from_str(name);
  return *level != spdlog::level::off || name == "off";
}

std::string ResolvePattern(const avatarpool::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("AVATARPOOL_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return kDefaultPattern;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  for (const char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendValue(std::ostringstream& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out << value;
    return;
  }
  out << '"';
  for (const char c : value) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\n': out << "\\n"; break;
      case '\t': out << "\\t"; break;
      default: out << c;
    }
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
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

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const avatarpool::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));

  const auto                level_name = ResolveLevelName(config);
  spdlog::level::level_enum level      = spdlog::level::info;
  const bool                known      = ParseLevel(level_name, &level);
  logger->set_level(known ? level : spdlog::level::info);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (!known) {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
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

} // namespace avatarpool::observability
