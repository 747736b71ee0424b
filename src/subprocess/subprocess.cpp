#include <patchgrader/subprocess/subprocess.hpp>

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/expected.hpp>
#include <patchgrader/common/linux.hpp>
#include <patchgrader/logging.hpp>

#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace patchgrader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

// Exit code of a child that could not exec, as the shell reports it
constexpr int EXEC_FAILED_CODE = 127;

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args)
    : exec_{std::move(exec)}
    , args_{std::move(args)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed, or the object was moved from
    if (child_pid_ == 0) {
        return;
    }

    if (!exit_code_ && is_alive()) {
        std::ignore = kill();
    }

    std::ignore = close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , exit_code_{std::exchange(other.exit_code_, std::nullopt)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, {.read_fd = -1, .write_fd = -1})}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {.read_fd = -1, .write_fd = -1})}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stdout_cursor_{std::exchange(other.stdout_cursor_, 0)}
    , stdout_eof_{std::exchange(other.stdout_eof_, false)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    exit_code_ = std::exchange(rhs.exit_code_, std::nullopt);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, {.read_fd = -1, .write_fd = -1});
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {.read_fd = -1, .write_fd = -1});
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stdout_cursor_ = std::exchange(rhs.stdout_cursor_, 0);
    stdout_eof_ = std::exchange(rhs.stdout_eof_, false);

    return *this;
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess started twice");

    return create();
}

bool Subprocess::is_alive() const {
    if (child_pid_ == 0 || exit_code_) {
        return false;
    }

    return linux::kill(child_pid_, 0).has_value();
}

Result<int> Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    if (exit_code_) {
        return exit_code_.value();
    }

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        // Keep the pipe drained so a chatty child never blocks on a full buffer
        TRY(read_stdout_impl());

        auto status = TRYE(linux::waitpid(child_pid_, WNOHANG), SyscallFailure);

        if (status.pid != 0) {
            exit_code_ = status.exit_code();

            // Collect whatever was written between the last read and exit
            TRY(read_stdout_impl());

            LOG_DEBUG("Process {} ({}) exited with code {}", child_pid_, exec_, exit_code_.value());
            return exit_code_.value();
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());

        if (remaining <= 0ms) {
            return ErrorKind::TimedOut;
        }

        // Wake up on output or at least every 50ms to check for exit
        auto poll_time = std::min(remaining, std::chrono::milliseconds{50});

        if (stdout_pipe_.read_fd != -1 && !stdout_eof_) {
            TRYE(linux::poll(stdout_pipe_.read_fd, POLLIN, static_cast<int>(poll_time.count())), SyscallFailure);
        } else {
            ::usleep(static_cast<useconds_t>(std::chrono::duration_cast<std::chrono::microseconds>(poll_time).count()));
        }
    }
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0 || exit_code_) {
        return {};
    }

    // Negative pid -> the whole process group
    if (auto res = linux::kill(-child_pid_, SIGKILL); !res) {
        // The group may already be gone; fall back to the child itself
        TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);
    }

    auto status = TRYE(linux::waitpid(child_pid_), SyscallFailure);
    exit_code_ = status.exit_code();

    if (auto res = read_stdout_impl(); !res) {
        LOG_WARN("Failed to read remaining output of {}: {}", exec_, res.error());
    }

    LOG_DEBUG("Killed process {} ({})", child_pid_, exec_);

    return {};
}

Result<std::string> Subprocess::read_stdout_poll_impl(int timeout_ms) {
    // If the pipe is already closed, all we can do is try reading from the buffer
    if (stdout_pipe_.read_fd == -1 || stdout_eof_) {
        return read_stdout();
    }

    int ready = TRYE(linux::poll(stdout_pipe_.read_fd, POLLIN, timeout_ms), SyscallFailure);

    // Timeout occured
    if (ready == 0) {
        return "";
    }

    return read_stdout();
}

Result<std::string> Subprocess::read_stdout() {
    TRY(read_stdout_impl());

    // Cursor is still at the end of the buffer -> no data was read
    if (stdout_cursor_ == stdout_buffer_.size()) {
        return "";
    }

    auto res = stdout_buffer_.substr(stdout_cursor_);
    stdout_cursor_ = stdout_buffer_.size();

    return res;
}

const std::string& Subprocess::get_full_stdout() {
    if (auto res = read_stdout_impl(); !res) {
        LOG_WARN("Failed to read remaining output of {}: {}", exec_, res.error());
    }

    return stdout_buffer_;
}

Result<void> Subprocess::read_stdout_impl() {
    if (stdout_pipe_.read_fd == -1 || stdout_eof_) {
        return {};
    }

    while (true) {
        auto chunk = linux::read(stdout_pipe_.read_fd, READ_CHUNK_SIZE);

        if (!chunk) {
            if (chunk.error() == std::errc::resource_unavailable_try_again) {
                return {};
            }
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            LOG_WARN("Error reading from stdout pipe of {}: '{}'", exec_, chunk.error().message());
            return ErrorKind::SyscallFailure;
        }

        // All write ends closed
        if (chunk->empty()) {
            stdout_eof_ = true;
            return {};
        }

        stdout_buffer_ += chunk.value();
    }
}

Result<void> Subprocess::send_stdin(std::string_view str) {
    if (stdin_pipe_.write_fd == -1) {
        LOG_WARN("Attempted to write to closed stdin of {}", exec_);
        return ErrorKind::SyscallFailure;
    }

    while (!str.empty()) {
        auto written = TRYE(linux::write(stdin_pipe_.write_fd, str), SyscallFailure);
        str.remove_prefix(static_cast<std::size_t>(written));
    }

    return {};
}

Result<void> Subprocess::close_stdin() {
    if (stdin_pipe_.write_fd != -1) {
        TRYE(linux::close(stdin_pipe_.write_fd), SyscallFailure);
        stdin_pipe_.write_fd = -1;
    }

    return {};
}

Result<void> Subprocess::close_pipes() {
    // Make sure all available data is read before pipes are closed
    if (auto res = read_stdout_impl(); !res) {
        LOG_WARN("Failed to read remaining output of {}: {}", exec_, res.error());
    }

    TRY(close_stdin());

    if (stdout_pipe_.read_fd != -1) {
        TRYE(linux::close(stdout_pipe_.read_fd), SyscallFailure);
        stdout_pipe_.read_fd = -1;
    }

    return {};
}

Result<void> Subprocess::create() {
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdin_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child();
    }

    // Parent process
    child_pid_ = fork_res.pid;

    // Also set from the parent so that kill() cannot race the child's own setpgid
    ::setpgid(child_pid_, child_pid_);

    LOG_TRACE("Started process {}: {} {}", child_pid_, exec_, fmt::join(args_, " "));

    return init_parent();
}

void Subprocess::exec_child() {
    // Never returns. Failures here cannot be propagated to the parent; the exit code tells it.
    ::setpgid(0, 0);

    bool redirected = linux::dup2(stdin_pipe_.read_fd, STDIN_FILENO).has_value() &&
                      linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO).has_value() &&
                      linux::dup2(stdout_pipe_.write_fd, STDERR_FILENO).has_value();

    if (redirected) {
        // O_CLOEXEC closes the original pipe fds on exec
        std::ignore = linux::execvp(exec_, args_);
    }

    ::_exit(EXEC_FAILED_CODE);
}

Result<void> Subprocess::init_parent() {
    // Close the pipe ends being used in the child proc
    //  - write end for stdout
    //  - read end for stdin
    TRYE(linux::close(stdin_pipe_.read_fd), SyscallFailure);
    stdin_pipe_.read_fd = -1;
    TRYE(linux::close(stdout_pipe_.write_fd), SyscallFailure);
    stdout_pipe_.write_fd = -1;

    // Make reading from stdout non-blocking
    int pre_flags = TRYE(linux::fcntl(stdout_pipe_.read_fd, F_GETFL), SyscallFailure);

    TRYE(linux::fcntl(stdout_pipe_.read_fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
         SyscallFailure);

    return {};
}

Result<CommandResult> run_command(const std::string& exec, const std::vector<std::string>& args,
                                  std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();

    Subprocess proc{exec, args};
    TRY(proc.start());
    TRY(proc.close_stdin());

    CommandResult result;

    auto exit_code = proc.wait_for_exit(timeout);

    if (exit_code) {
        result.exit_code = exit_code.value();
    } else if (exit_code.error() == ErrorKind::TimedOut) {
        LOG_DEBUG("{} timed out after {}; killing", exec, timeout);
        result.timed_out = true;
        TRY(proc.kill());
    } else {
        return exit_code.error();
    }

    result.output = proc.get_full_stdout();
    result.elapsed = steady_clock::now() - start_time;

    return result;
}

} // namespace patchgrader
