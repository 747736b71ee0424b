#pragma once

#include <patchgrader/common/expected.hpp>
#include <patchgrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace patchgrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// reads fromm a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        // EAGAIN is the normal outcome of draining a non-blocking pipe
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// Replace the current process image, searching PATH for ``file``.
/// args do NOT need to have an extra NULL element; this is added for you.
/// see execvp(3)
/// returns only on failure; logs failure at debug level
inline Expected<> execvp(const std::string& file, const std::vector<std::string>& args) {
    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(file.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);

    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    int res = ::execvp(file.c_str(), cstr_arg_list.data());

    auto err = make_error_code(errno);

    if (res == -1) {
        LOG_DEBUG("execvp failed: '{}'", err.message());
    } else {
        LOG_DEBUG("execvp failed (INVALID RETURN CODE = {}): '{}'", res, err.message());
    }

    return err;
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see dup(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        if (res == -1) {
            LOG_DEBUG("dup2 failed: '{}'", err.message());
        } else {
            LOG_DEBUG("dup2 failed (INVALID RETURN CODE = {}): '{}'", res, err.message());
        }

        return err;
    }

    return {};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return Expected<int>{res};
}

struct WaitStatus
{
    pid_t pid; ///< 0 if the child has not changed state (WNOHANG)
    int status;

    bool exited() const { return pid != 0 && WIFEXITED(status); }

    bool signaled() const { return pid != 0 && WIFSIGNALED(status); }

    /// Exit code, or ``128 + signal`` for a child killed by a signal, like a shell reports it
    int exit_code() const {
        if (exited()) {
            return WEXITSTATUS(status);
        }
        if (signaled()) {
            return 128 + WTERMSIG(status); // NOLINT(readability-magic-numbers)
        }
        return -1;
    }
};

/// see waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status{};
    pid_t res = ::waitpid(pid, &status, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err.message());

        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); logs failure at debug level
inline Expected<int> poll(int fd, short events, int timeout_ms) {
    struct pollfd poll_struct = {.fd = fd, .events = events, .revents = 0};

    int res = ::poll(&poll_struct, 1, timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// see getrlimit(2)
inline Expected<struct ::rlimit> getrlimit(int resource) {
    struct ::rlimit limit{};

    int res = ::getrlimit(resource, &limit);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("getrlimit failed: '{}'", err.message());

        return err;
    }

    return limit;
}

/// see setrlimit(2)
inline Expected<> setrlimit(int resource, const struct ::rlimit& limit) {
    int res = ::setrlimit(resource, &limit);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setrlimit failed: '{}'", err.message());

        return err;
    }

    return {};
}

} // namespace patchgrader::linux
