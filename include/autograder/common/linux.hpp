#pragma once

#include <autograder/common/expected.hpp>
#include <autograder/logging.hpp>

#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace autograder::linux {

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

/// reads at most `count` bytes from a file descriptor. See read(2)
/// A result of size 0 means end of file
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = 0;
    do {
        res = ::read(fd, buffer.data(), count);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
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

struct WaitStatus
{
    enum { Exited, Signaled } kind;

    int code; // exit status, or the terminating signal number
};

/// Blocks until `pid` terminates. See waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitStatus> waitpid(pid_t pid) {
    int status = 0;
    pid_t res = 0;

    do {
        res = ::waitpid(pid, &status, 0);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("waitpid failed: '{}'", err.message());
        return err;
    }

    if (WIFSIGNALED(status)) {
        return WaitStatus{.kind = WaitStatus::Signaled, .code = WTERMSIG(status)};
    }

    return WaitStatus{.kind = WaitStatus::Exited, .code = WEXITSTATUS(status)};
}

/// Blocks until `pid` terminates, leaving it waitable. See waitid(2) with WNOWAIT
/// returns success/failure; logs failure at debug level
inline Expected<> wait_terminated(pid_t pid) {
    siginfo_t info{};
    int res = 0;

    do {
        res = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("waitid failed: '{}'", err.message());
        return err;
    }

    return {};
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
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("pipe failed: '{}'", err.message());
        return err;
    }

    return pipe;
}

/// see link(2)
/// returns success/failure; logs failure at debug level
inline Expected<> link(const std::string& oldpath, const std::string& newpath) {
    int res = ::link(oldpath.c_str(), newpath.c_str());

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("link failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see mkdtemp(3). `templ` must end in "XXXXXX"
/// returns the created directory; logs failure at debug level
inline Expected<std::string> mkdtemp(std::string templ) {
    if (::mkdtemp(templ.data()) == nullptr) {
        auto err = make_error_code(errno);
        LOG_DEBUG("mkdtemp failed: '{}'", err.message());
        return err;
    }

    return templ;
}

using SignalHandlerT = void (*)(int);

inline Expected<SignalHandlerT> signal(int sig, SignalHandlerT handler) {
    SignalHandlerT prev_handler = ::signal(sig, handler);

    if (prev_handler == SIG_ERR) {
        auto err = make_error_code();
        LOG_DEBUG("signal failed: '{}'", err.message());
        return err;
    }

    return prev_handler;
}

} // namespace autograder::linux
