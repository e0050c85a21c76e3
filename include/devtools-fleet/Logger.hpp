#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace dtfleet {

/// Process-wide logging with component and tag context.
///
/// Console output goes to stderr so that command results printed on stdout
/// (for example the port bound by `start`) stay machine-readable.
class FleetLogger {
public:
  static FleetLogger &instance();

  // Initialize with console and rotating file sinks. An empty log_file, or a
  // file that cannot be opened, leaves only the console sink.
  void init(const std::string &log_file = "devtools-fleet.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!log_file.empty()) {
      try {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        fmt::print(stderr, "Log file {} unavailable ({}), console only\n",
                   log_file, ex.what());
      }
    }

    logger_ = std::make_shared<spdlog::logger>("fleet", sinks.begin(),
                                               sinks.end());
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);

    if (!spdlog::get("fleet")) {
      spdlog::register_logger(logger_);
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("fleet");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  FleetLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [tag] message
    std::string prefix = fmt::format("[{}] [{}] ", component, tag);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(component, tag, ...)                                         \
  dtfleet::FleetLogger::instance().trace(component, tag, __VA_ARGS__)
#define LOG_DEBUG(component, tag, ...)                                         \
  dtfleet::FleetLogger::instance().debug(component, tag, __VA_ARGS__)
#define LOG_INFO(component, tag, ...)                                          \
  dtfleet::FleetLogger::instance().info(component, tag, __VA_ARGS__)
#define LOG_WARN(component, tag, ...)                                          \
  dtfleet::FleetLogger::instance().warn(component, tag, __VA_ARGS__)
#define LOG_ERROR(component, tag, ...)                                         \
  dtfleet::FleetLogger::instance().error(component, tag, __VA_ARGS__)

} // namespace dtfleet
