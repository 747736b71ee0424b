#pragma once

#include <patchgrader/common/class_traits.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

// Set log level based on whether we're in DEBUG mode
// Needs to be done before including spdlog
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
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

#ifdef DEBUG
#define DEBUG_TIME(expr)                                                                                               \
    [&]() {                                                                                                            \
        ::patchgrader::detail::DebugTimeHelper debug_time_helper__(#expr);                                             \
        return expr;                                                                                                   \
    }()
#else
#define DEBUG_TIME(expr) (expr)
#endif

namespace patchgrader {
namespace detail {

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
struct DebugTimeHelper : NonMovable
{
    explicit DebugTimeHelper(std::string_view str)
        : str_expr(str)
        , start{std::chrono::steady_clock::now()} {}

    ~DebugTimeHelper() {
        const auto& stop = std::chrono::steady_clock::now();
        LOG_DEBUG("{} took {:%S}s to execute", str_expr, stop - start);
    }

    std::string_view str_expr;
    std::chrono::steady_clock::time_point start;
};

} // namespace detail

/// Obtain Linux error code message given by ``err`` via libc functions
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Obtain Linux error (i.e., ``errno``) message via libc functions
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

inline void init_loggers() {
#if defined(RELEASE)
    spdlog::set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::info);
#endif

    // Override any previously set log-level with the enviornment variable LOG_LEVEL, if set
    spdlog::cfg::load_env_levels("LOG_LEVEL");

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [tid %6t] [%30!!@%20!s:%-4#] %v");
#else
    // Pattern:
    //   time - [HH:MM:SS.MS]
    //   level (colored, center aligned) - [ info ]
    //   thread id - [tid 12345]
    //   message - "foo bar"
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] [tid %6t] %v");
#endif

    // Log to stderr; stdout is reserved for run summaries.
    // Workers log concurrently, so the sink must be the multi-threaded variant.
    spdlog::set_default_logger(spdlog::stderr_color_mt("default"));
}

/// Create a logger that writes only to ``log_file`` (truncating it).
/// The logger is not registered globally; callers own its lifetime.
inline std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name,
                                                        const std::filesystem::path& log_file) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), /*truncate=*/true);
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));

    logger->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);

    return logger;
}

} // namespace patchgrader
