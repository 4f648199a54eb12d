#pragma once

#include <autograder/common/formatters/enum.hpp> // IWYU pragma: keep

#include <boost/describe/enum.hpp>

#include <string>

#include <sys/types.h>

namespace autograder {

/// How a supervised run ended. `TimedOut` takes precedence over everything else.
// NOLINTNEXTLINE
BOOST_DEFINE_ENUM_CLASS(ProcessOutcome, Completed, TimedOut, OutputLimitExceeded);

struct RunResult
{
    /// Exit status, or the negated signal number if the process was killed by a signal
    int exit_code{};

    /// At most `output_limit` bytes of merged stdout/stderr
    std::string output;

    ProcessOutcome outcome = ProcessOutcome::Completed;

    pid_t pid{};
};

} // namespace autograder
