#pragma once

#include <autograder/grading_session.hpp>
#include <autograder/output/serializer.hpp>
#include <autograder/project/assignment.hpp>
#include <autograder/subprocess/process_runner.hpp>
#include <autograder/test/staging.hpp>
#include <autograder/test/test_case.hpp>

#include <memory>

namespace autograder {

struct RunOptions
{
    RequestSet requests;
    /// Stop at the first failed test, or after the build if any error occurred
    bool stop_on_failure = false;
    /// Prepare the build directory, then stop
    bool init_only = false;
};

/// Drives one assignment through gather, build-directory preparation, build, test execution and scoring.
/// Tests run one at a time, in gather order.
class AssignmentRunner
{
public:
    AssignmentRunner(Assignment& assignment, const std::shared_ptr<Serializer>& serializer, RunMetadata metadata);

    /// The summary is reported to the serializer only if the run went all the way through
    RunSummary run(const AssignmentContext& ctx, const RunOptions& opts);

    StagingConfig get_staging() const { return staging_; }

private:
    /// Returns whether the test passed
    bool run_one(TestCase& test);

    RunSummary make_summary() const;

    Assignment* assignment_;
    std::shared_ptr<Serializer> serializer_;
    RunMetadata metadata_;
    ProcessRunner runner_;

    StagingConfig staging_;
    RunTally tally_;
    ScoreTable scores_;
};

} // namespace autograder
