#include <autograder/subprocess/subprocess.hpp>

#include <autograder/common/error_types.hpp>
#include <autograder/common/linux.hpp>
#include <autograder/logging.hpp>

#include <range/v3/algorithm/transform.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <signal.h>
#include <string.h>
#include <unistd.h>

namespace autograder {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

constexpr int EXEC_FAILURE_EXIT_CODE = 127;

// Writing to a pipe whose reader has exited must surface as EPIPE instead of killing the grader
void ignore_sigpipe() {
    static const bool IGNORED = [] {
        if (auto res = linux::signal(SIGPIPE, SIG_IGN); !res) {
            LOG_WARN("Unable to ignore SIGPIPE: {}", res.error().message());
            return false;
        }
        return true;
    }();

    std::ignore = IGNORED;
}

} // namespace

Subprocess::Subprocess(std::vector<std::string> args, std::filesystem::path working_dir)
    : args_{std::move(args)}
    , working_dir_{std::move(working_dir)} {
    ASSERT(!args_.empty(), "Attempt to create a Subprocess with an empty command");
}

Subprocess::~Subprocess() {
    close_fds();

    // if child_pid_ == 0, then the subprocess was never started
    if (child_pid_ == 0 || has_exited()) {
        return;
    }

    // Leave no orphans behind
    std::ignore = kill();

    if (auto res = wait_for_exit(); !res) {
        LOG_WARN("Unable to reap subprocess {}: {}", child_pid_, res.error());
    }
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess started twice");

    ignore_sigpipe();

    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> argv(args_.size() + 1, nullptr);
    ranges::transform(args_, argv.begin(), [](const std::string& str) { return const_cast<char*>(str.c_str()); });
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    stdout_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stdin_pipe_ = TRYE(linux::pipe2(), SyscallFailure);

    auto fork_res = linux::fork();
    if (!fork_res) {
        close_fds();
        return ErrorKind::SyscallFailure;
    }

    // Child process
    if (fork_res->which == linux::Fork::Child) {
        exec_child(argv);
    }

    // Parent process
    child_pid_ = fork_res->pid;

    // Also done by the child; whichever runs first wins, so a kill can never miss the group
    ::setpgid(child_pid_, child_pid_);

    LOG_DEBUG("Started subprocess {} with args {}", child_pid_, args_);

    // Close the pipe ends being used in the child proc
    //  - read end for stdin
    //  - write end for stdout
    TRYE(linux::close(std::exchange(stdin_pipe_.read_fd, -1)), SyscallFailure);
    TRYE(linux::close(std::exchange(stdout_pipe_.write_fd, -1)), SyscallFailure);

    return {};
}

void Subprocess::exec_child(const std::vector<char*>& argv) {
    // Only async-signal-safe calls between fork and exec; no logging

    auto fail = [](const char* what) {
        const char* reason = ::strerror(errno);
        std::ignore = ::write(STDOUT_FILENO, what, std::strlen(what));
        std::ignore = ::write(STDOUT_FILENO, ": ", 2);
        std::ignore = ::write(STDOUT_FILENO, reason, std::strlen(reason));
        std::ignore = ::write(STDOUT_FILENO, "\n", 1);
        ::_exit(EXEC_FAILURE_EXIT_CODE);
    };

    ::setpgid(0, 0);

    // The pipes were created with O_CLOEXEC; the duplicated standard fds are not
    if (::dup2(stdin_pipe_.read_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stdout_pipe_.write_fd, STDERR_FILENO) == -1) {
        ::_exit(EXEC_FAILURE_EXIT_CODE);
    }

    if (!working_dir_.empty() && ::chdir(working_dir_.c_str()) == -1) {
        fail("chdir failed");
    }

    ::execvp(argv.front(), argv.data());

    fail("exec failed");
    __builtin_unreachable();
}

Result<void> Subprocess::send_stdin(std::string_view str) {
    if (stdin_pipe_.write_fd == -1 || stdin_broken_) {
        return {};
    }

    while (!str.empty()) {
        auto res = linux::write(stdin_pipe_.write_fd, str);

        if (!res) {
            if (res.error() == std::errc::broken_pipe) {
                LOG_DEBUG("Subprocess {} closed its stdin; discarding {} bytes of input", child_pid_, str.size());
                stdin_broken_ = true;
                return {};
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        str.remove_prefix(static_cast<std::size_t>(res.value()));
    }

    return {};
}

Result<void> Subprocess::close_stdin() {
    if (stdin_pipe_.write_fd != -1) {
        TRYE(linux::close(std::exchange(stdin_pipe_.write_fd, -1)), SyscallFailure);
    }

    return {};
}

Result<std::string> Subprocess::read_stdout(std::size_t max_bytes) {
    std::string result;

    if (stdout_pipe_.read_fd == -1) {
        return result;
    }

    while (result.size() < max_bytes) {
        const std::size_t want = std::min(READ_CHUNK_SIZE, max_bytes - result.size());

        std::string chunk = TRYE(linux::read(stdout_pipe_.read_fd, want), SyscallFailure);

        // End of file
        if (chunk.empty()) {
            break;
        }

        result += chunk;
    }

    return result;
}

Result<std::string> Subprocess::read_all_stdout() {
    std::string result;

    if (stdout_pipe_.read_fd == -1) {
        return result;
    }

    while (true) {
        std::string chunk = TRYE(linux::read(stdout_pipe_.read_fd, READ_CHUNK_SIZE), SyscallFailure);

        if (chunk.empty()) {
            return result;
        }

        result += chunk;
    }
}

Result<void> Subprocess::kill() const {
    ASSERT(child_pid_ != 0, "Attempt to kill a subprocess that was never started");

    if (linux::kill(-child_pid_, SIGKILL)) {
        return {};
    }

    // Group may not exist if setpgid failed in both processes; fall back to the child alone
    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);

    return {};
}

Result<void> Subprocess::wait_terminated() const {
    ASSERT(child_pid_ != 0, "Attempt to wait for a subprocess that was never started");

    if (exit_code_) {
        return {};
    }

    TRYE(linux::wait_terminated(child_pid_), SyscallFailure);

    return {};
}

Result<int> Subprocess::wait_for_exit() {
    ASSERT(child_pid_ != 0, "Attempt to wait for a subprocess that was never started");

    if (exit_code_) {
        return *exit_code_;
    }

    linux::WaitStatus status = TRYE(linux::waitpid(child_pid_), SyscallFailure);

    if (status.kind == linux::WaitStatus::Signaled) {
        LOG_DEBUG("Subprocess {} killed by signal {} ({})", child_pid_, status.code, ::strsignal(status.code));
        exit_code_ = -status.code;
    } else {
        exit_code_ = status.code;
    }

    return *exit_code_;
}

void Subprocess::close_fds() {
    for (int* fd : {&stdin_pipe_.read_fd, &stdin_pipe_.write_fd, &stdout_pipe_.read_fd, &stdout_pipe_.write_fd}) {
        if (*fd != -1) {
            std::ignore = linux::close(std::exchange(*fd, -1));
        }
    }
}

} // namespace autograder
