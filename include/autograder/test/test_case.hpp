#pragma once

#include <autograder/common/class_traits.hpp>
#include <autograder/common/formatters/enum.hpp> // IWYU pragma: keep
#include <autograder/compare/diagnostic.hpp>
#include <autograder/compare/output_verifier.hpp>
#include <autograder/grading_session.hpp>
#include <autograder/subprocess/process_runner.hpp>
#include <autograder/test/input_delivery.hpp>
#include <autograder/test/staging.hpp>
#include <autograder/test/test_spec.hpp>

#include <boost/describe/enum.hpp>

#include <memory>
#include <string>
#include <vector>

namespace autograder {

// NOLINTNEXTLINE
BOOST_DEFINE_ENUM_CLASS(TestState, Created, Prepared, Running, TimedOut, OutputLimitExceeded, Completed);

/// One runnable test: a command with its limits, how input reaches the subject, how output is judged,
/// and the companion files staged beside it.
///
/// Lifecycle: Created -> `prepare` -> Prepared -> `execute` -> {TimedOut, OutputLimitExceeded, Completed}.
/// A test in a terminal state may be prepared and executed again.
class TestCase : NonCopyable
{
public:
    TestCase(std::string group, double weight, Category category, TestSpec spec,
             std::unique_ptr<InputDelivery> input, std::unique_ptr<OutputVerifier> verifier,
             std::vector<StagedFile> staged_files = {});

    /// Stage companion files into the working directory.
    /// Returns the staging configuration, downgraded if a link failed.
    StagingConfig prepare(StagingConfig staging);

    /// Run the subject and judge it. The result's input is left for the caller to render.
    /// Throws TestIOError if a fixture file cannot be read; the test returns to Created.
    TestResult execute(const ProcessRunner& runner);

    TestState get_state() const { return state_; }

    const std::string& get_group() const { return group_; }

    double get_weight() const { return weight_; }

    Category get_category() const { return category_; }

    const TestSpec& get_spec() const { return spec_; }

    const InputDelivery& get_input() const { return *input_; }

    const OutputVerifier& get_verifier() const { return *verifier_; }

    const std::vector<StagedFile>& get_staged_files() const { return staged_files_; }

private:
    bool is_terminal() const;

    void judge(const RunResult& run);

    std::string group_;
    double weight_;
    Category category_;
    TestSpec spec_;
    std::unique_ptr<InputDelivery> input_;
    std::unique_ptr<OutputVerifier> verifier_;
    std::vector<StagedFile> staged_files_;

    TestState state_ = TestState::Created;

    /// Only meaningful between `prepare` and the end of `execute`
    Diagnostic diag_;
};

} // namespace autograder
