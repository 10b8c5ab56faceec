#pragma once
#include "datamodel-schema/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace dmschema {

/// Centralized logging with component and operation context
class DATAMODEL_SCHEMA_API SchemaLogger {
public:
  static SchemaLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "datamodel_schema.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("datamodel", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("datamodel")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop from the spdlog registry so a later init() recreates the sinks
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("datamodel");
    logger_.reset();
  }

  bool initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  SchemaLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &operation, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [operation] message
    std::string prefix = fmt::format("[{}] [{}] ", component, operation);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Map a level name ("trace".."error", "off") to spdlog. Returns false for an
/// unknown name and leaves `level` untouched.
DATAMODEL_SCHEMA_API bool parse_log_level(const std::string &name,
                                          spdlog::level::level_enum &level);

// Convenience macros
#define LOG_TRACE(component, op, ...)                                          \
  dmschema::SchemaLogger::instance().trace(component, op, __VA_ARGS__)
#define LOG_DEBUG(component, op, ...)                                          \
  dmschema::SchemaLogger::instance().debug(component, op, __VA_ARGS__)
#define LOG_INFO(component, op, ...)                                           \
  dmschema::SchemaLogger::instance().info(component, op, __VA_ARGS__)
#define LOG_WARN(component, op, ...)                                           \
  dmschema::SchemaLogger::instance().warn(component, op, __VA_ARGS__)
#define LOG_ERROR(component, op, ...)                                          \
  dmschema::SchemaLogger::instance().error(component, op, __VA_ARGS__)

} // namespace dmschema
