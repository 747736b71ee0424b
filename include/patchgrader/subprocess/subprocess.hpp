#pragma once

#include <patchgrader/common/class_traits.hpp>
#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/linux.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace patchgrader {

/// A child process with its stdout and stderr merged into one pipe, and a stdin pipe.
///
/// The child is placed in its own process group so that ``kill`` also takes down anything
/// it spawned.
class Subprocess : NonCopyable
{
public:
    /// ``exec`` is searched for in PATH. ENV variables are inherited.
    Subprocess(std::string exec, std::vector<std::string> args);
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    Result<void> start();

    template <typename Rep, typename Period>
    Result<std::string> read_stdout(const std::chrono::duration<Rep, Period>& timeout) {
        return read_stdout_poll_impl(
            static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()));
    }

    /// Output produced since the last call to one of the ``read_stdout`` overloads
    Result<std::string> read_stdout();

    /// Everything the process has written so far
    const std::string& get_full_stdout();

    Result<void> send_stdin(std::string_view str);

    /// Signal end-of-input to the child
    Result<void> close_stdin();

    /// Waits for the child to exit, draining its output meanwhile.
    /// Returns the exit code (``128 + signal`` when killed by a signal), or TimedOut.
    Result<int> wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGKILL the process group and reap the child
    Result<void> kill();

    bool is_alive() const;

    std::optional<int> get_exit_code() const { return exit_code_; }

    pid_t get_pid() const { return child_pid_; }

private:
    Result<void> create();
    void exec_child();
    Result<void> init_parent();

    Result<std::string> read_stdout_poll_impl(int timeout_ms);
    Result<void> read_stdout_impl();

    Result<void> close_pipes();

    std::string exec_;
    std::vector<std::string> args_;

    pid_t child_pid_{};
    std::optional<int> exit_code_;

    linux::Pipe stdin_pipe_{.read_fd = -1, .write_fd = -1};
    linux::Pipe stdout_pipe_{.read_fd = -1, .write_fd = -1};

    std::string stdout_buffer_;
    std::size_t stdout_cursor_{};
    bool stdout_eof_ = false;
};

struct CommandResult
{
    std::optional<int> exit_code; ///< nullopt if the command timed out
    std::string output;           ///< merged stdout and stderr
    bool timed_out = false;
    std::chrono::duration<double> elapsed{};

    bool succeeded() const { return exit_code.has_value() && exit_code.value() == 0; }
};

/// Run ``exec`` with ``args`` to completion, killing it once ``timeout`` is reached.
/// Output produced up to that point is preserved.
Result<CommandResult> run_command(const std::string& exec, const std::vector<std::string>& args,
                                  std::chrono::milliseconds timeout);

} // namespace patchgrader
