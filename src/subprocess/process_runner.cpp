#include <autograder/subprocess/process_runner.hpp>

#include <autograder/common/error_types.hpp>
#include <autograder/compare/text.hpp>
#include <autograder/logging.hpp>
#include <autograder/subprocess/deadline.hpp>
#include <autograder/subprocess/run_result.hpp>
#include <autograder/subprocess/subprocess.hpp>

#include <string>
#include <tuple>
#include <utility>

namespace autograder {

Result<RunResult> ProcessRunner::run(const ProcessRequest& request, const InputCallback& deliver_input) const {
    LOG_DEBUG("Running {} in {} (time limit {}, output limit {} bytes)", request.args, quote(request.working_dir.string()),
              request.time_limit, request.output_limit);

    Subprocess proc{request.args, request.working_dir};
    TRY(proc.start());

    // Declared after `proc`, so it is always disarmed before `proc` can be reaped and destroyed
    Deadline deadline{request.time_limit, [&proc] { std::ignore = proc.kill(); }};

    if (deliver_input) {
        deliver_input(proc);
    }
    TRY(proc.close_stdin());

    RunResult result{.pid = proc.get_pid()};
    bool over_limit = false;

    result.output = TRY(proc.read_stdout(request.output_limit));

    if (result.output.size() == request.output_limit) {
        std::string extra = TRY(proc.read_stdout(1));

        if (!extra.empty()) {
            LOG_DEBUG("Subprocess {} exceeded output limit of {} bytes", result.pid, request.output_limit);
            over_limit = true;
            TRY(proc.kill());
        }
    }

    // The child may close its output and keep running; the deadline stays armed until it terminates
    TRY(proc.wait_terminated());

    const bool timed_out = deadline.disarm();

    result.exit_code = TRY(proc.wait_for_exit());

    if (timed_out) {
        result.outcome = ProcessOutcome::TimedOut;
    } else if (over_limit) {
        result.outcome = ProcessOutcome::OutputLimitExceeded;
    }

    LOG_DEBUG("Complete. Code {} ({}), {} bytes of output", result.exit_code, result.outcome, result.output.size());

    return result;
}

} // namespace autograder
