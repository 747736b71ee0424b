#pragma once

#include <patchgrader/common/expected.hpp>
#include <patchgrader/logging.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>
#include <system_error>

namespace patchgrader {

__attribute__((format(strftime, 2, 0))) // help the compiler check `format` for validity
inline Expected<std::string>
to_localtime_string(std::chrono::system_clock::time_point time_point, const char* format = "%Y-%m-%d %H:%M:%S") {

    // Convert to time_t (seconds since epoch)
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);

    // Convert to broken-down local time
    std::tm tm_buf{};

    if (localtime_r(&time, &tm_buf) != &tm_buf) {
        auto err = errno;
        LOG_WARN("localtime_r failed to convert to local time: {}", get_err_msg(err));
        return std::error_code{err, std::generic_category()};
    }

    constexpr std::size_t BUF_SZ = 256;
    std::array<char, BUF_SZ> buf{};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    if (std::size_t num_chars = std::strftime(buf.data(), buf.size(), format, &tm_buf)) {
        return std::string{buf.data(), num_chars};
    }
#pragma GCC diagnostic pop

    LOG_WARN("strftime produced no output for format "{}"", format);
    return std::make_error_code(std::errc::invalid_argument);
}

/// Human readable duration, e.g. "1h 02m 03s" or "4.2s"
inline std::string format_duration(std::chrono::duration<double> duration) {
    using namespace std::chrono;

    constexpr double SHORT_THRESHOLD = 60.0;

    if (duration.count() < SHORT_THRESHOLD) {
        return fmt::format("{:.1f}s", duration.count());
    }

    auto total = duration_cast<seconds>(duration);
    auto hrs = duration_cast<hours>(total);
    auto mins = duration_cast<minutes>(total - hrs);
    auto secs = total - hrs - mins;

    if (hrs.count() > 0) {
        return fmt::format("{}h {:02}m {:02}s", hrs.count(), mins.count(), secs.count());
    }

    return fmt::format("{}m {:02}s", mins.count(), secs.count());
}

} // namespace patchgrader
