#pragma once
#include <boost/log/trivial.hpp>
#include <atomic>
#include <string>

#include "devicehost/log/log_config.hpp"

namespace devicehost::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
};

boost::log::trivial::severity_level to_boost_level(LogConfig::LogLevel level);

/// @brief A named logger with its own minimum severity.
/// Records go through the global Boost.Log core prefixed with "[name]", so the
/// global filter still applies on top of the scoped one.
class ScopedLogger {
public:
    ScopedLogger(std::string name,
                 LogConfig::LogLevel min_level = LogConfig::LogLevel::INFO)
        : name_(std::move(name)), min_level_(min_level) {}

    ScopedLogger(const ScopedLogger &other)
        : name_(other.name_), min_level_(other.min_level_.load()) {}

    const std::string &name() const { return name_; }
    LogConfig::LogLevel level() const { return min_level_; }
    void set_level(LogConfig::LogLevel level) { min_level_ = level; }

    bool enabled(LogConfig::LogLevel level) const {
        return level >= min_level_.load();
    }

private:
    std::string name_;
    std::atomic<LogConfig::LogLevel> min_level_;
};

}  // namespace devicehost::log

#define DEVICEHOST_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define DEVICEHOST_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define DEVICEHOST_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define DEVICEHOST_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define DEVICEHOST_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define DEVICEHOST_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#define DEVICEHOST_SLOG(logger, level, severity)                         \
    if (!(logger).enabled(::devicehost::log::LogConfig::LogLevel::level)) \
        ;                                                                 \
    else                                                                  \
        BOOST_LOG_TRIVIAL(severity) << "[" << (logger).name() << "] "

#define DEVICEHOST_SLOG_TRACE(logger) DEVICEHOST_SLOG(logger, TRACE, trace)
#define DEVICEHOST_SLOG_DEBUG(logger) DEVICEHOST_SLOG(logger, DEBUG, debug)
#define DEVICEHOST_SLOG_INFO(logger) DEVICEHOST_SLOG(logger, INFO, info)
#define DEVICEHOST_SLOG_WARN(logger) DEVICEHOST_SLOG(logger, WARN, warning)
#define DEVICEHOST_SLOG_ERROR(logger) DEVICEHOST_SLOG(logger, ERROR, error)
#define DEVICEHOST_SLOG_FATAL(logger) DEVICEHOST_SLOG(logger, FATAL, fatal)
