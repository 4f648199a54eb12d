#pragma once

#include <autograder/common/class_traits.hpp>
#include <autograder/common/error_types.hpp>
#include <autograder/common/linux.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace autograder {

/// A child process with a writable stdin and a single stdout pipe that stderr is merged into.
///
/// The child is placed in its own process group so that `kill` also takes down anything it
/// spawned. A started subprocess is always reaped: if the owner never waited for it, the
/// destructor kills and reaps it.
class Subprocess : NonMovable
{
public:
    /// `args[0]` is the program; it is looked up in PATH if it contains no '/'.
    /// The child changes into `working_dir` (if nonempty) before executing.
    explicit Subprocess(std::vector<std::string> args, std::filesystem::path working_dir = {});
    ~Subprocess();

    /// Forks the current process to start the subprocess
    Result<void> start();

    /// Write all of `str` to the child's stdin.
    /// A child that has closed its stdin is not an error; the data is discarded.
    Result<void> send_stdin(std::string_view str);

    /// Close the write end of the child's stdin, delivering EOF. Idempotent.
    Result<void> close_stdin();

    /// Block until `max_bytes` bytes were read or the child closes its output.
    /// Never buffers more than `max_bytes`.
    Result<std::string> read_stdout(std::size_t max_bytes);

    /// Block until the child closes its output
    Result<std::string> read_all_stdout();

    /// Send SIGKILL to the child's process group. Does not reap the child.
    /// Safe to call from another thread while the owner is blocked reading or writing.
    Result<void> kill() const;

    /// Block until the child has terminated, without reaping it.
    /// The pid stays reserved, so a concurrent `kill` cannot reach a recycled process.
    Result<void> wait_terminated() const;

    /// Block until the child has terminated and reap it.
    /// Returns the exit status, or the negated signal number if the child was killed by a signal.
    Result<int> wait_for_exit();

    bool has_started() const { return child_pid_ != 0; }

    bool has_exited() const { return exit_code_.has_value(); }

    pid_t get_pid() const { return child_pid_; }

    std::optional<int> get_exit_code() const { return exit_code_; }

    const std::vector<std::string>& get_args() const { return args_; }

private:
    /// Runs in the child between fork and exec. Never returns.
    [[noreturn]] void exec_child(const std::vector<char*>& argv);

    void close_fds();

    std::vector<std::string> args_;
    std::filesystem::path working_dir_;

    pid_t child_pid_{};

    /// The parent only makes use of the write end of stdin_pipe_, and the read end of stdout_pipe_
    linux::Pipe stdin_pipe_{-1, -1};
    linux::Pipe stdout_pipe_{-1, -1};

    bool stdin_broken_ = false;

    std::optional<int> exit_code_;
};

} // namespace autograder
