#pragma once

#include <autograder/common/error_types.hpp>
#include <autograder/subprocess/run_result.hpp>
#include <autograder/subprocess/subprocess.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace autograder {

struct ProcessRequest
{
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::chrono::milliseconds time_limit;
    std::size_t output_limit;
};

/// Writes a test's input to the subject. Closing stdin afterwards is handled by the runner.
/// May throw; the subject is then killed and reaped before the exception leaves `run`.
using InputCallback = std::function<void(Subprocess&)>;

/// Runs one subject process under a wall-clock deadline and an output byte cap.
///
/// Order of operations:
///   1. spawn, arm the deadline
///   2. deliver input and close stdin
///   3. read merged output until `output_limit` bytes, EOF, or the deadline kills the subject
///   4. if the cap was reached, read one more byte; any byte kills the subject
///   5. disarm the deadline, then reap the subject for its definitive exit code
///
/// A fired deadline means `TimedOut`, regardless of anything else observed.
class ProcessRunner
{
public:
    Result<RunResult> run(const ProcessRequest& request, const InputCallback& deliver_input = {}) const;
};

} // namespace autograder
