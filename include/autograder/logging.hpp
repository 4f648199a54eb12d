#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cerrno>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// Set log level based on whether we're in DEBUG mode
// Needs to be done before including spdlog
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

namespace autograder {

/// Obtain Linux error code message given by ``err`` via libc functions
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Obtain Linux error (i.e., ``errno``) message via libc functions
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

struct LoggingOptions
{
    /// Append-mode log file. Nothing is written to disk if unset.
    std::optional<std::filesystem::path> log_file;

    /// Lower the log level to debug
    bool debug = false;
};

/// (Re)initialize the default logger
///
/// Diagnostics for the person being graded go through the output serializers, so the
/// terminal only sees warnings and worse. Everything at the configured level goes to the
/// log file, if one is given.
inline void init_loggers(const LoggingOptions& opts = {}) {
    std::vector<spdlog::sink_ptr> sinks;

    // Log to stderr. See https://github.com/gabime/spdlog/wiki/FAQ#switch-the-default-logger-to-stderr
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_level(spdlog::level::warn);
    sinks.push_back(std::move(stderr_sink));

    if (opts.log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.log_file->string(), false));
        } catch (const spdlog::spdlog_ex& ex) {
            // Not being able to log is no reason to not grade
            fmt::print(stderr, "Unable to open log file {}: {}\n", opts.log_file->string(), ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("default", sinks.begin(), sinks.end());
    spdlog::set_default_logger(std::move(logger));

#if defined(TRACE)
    spdlog::set_level(spdlog::level::trace);
#elif defined(DEBUG)
    spdlog::set_level(spdlog::level::debug);
#else
    spdlog::set_level(opts.debug ? spdlog::level::debug : spdlog::level::info);
#endif

    // Override any previously set log-level with the enviornment variable LOG_LEVEL, if set
    spdlog::cfg::load_env_levels("LOG_LEVEL");

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [%30!!@%20!s:%-4#] %v");
#else
    // Pattern:
    //   date + time - [YYYY-MM-DD HH:MM:SS.MS]
    //   level (colored, center aligned) - [ info ]
    //   message - "foo bar"
    spdlog::set_pattern("[%Y-%m-%d %T.%e] [%^%=8l%$] %v");
#endif
}

} // namespace autograder
