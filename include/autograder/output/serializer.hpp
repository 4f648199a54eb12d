#pragma once

#include <autograder/common/class_traits.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/grading_session.hpp>
#include <autograder/output/sink.hpp>
#include <autograder/output/verbosity.hpp>

#include <string_view>

namespace autograder {

/// Receives the events of an orchestration run and renders them for a reader
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;

    /// A standalone line, e.g. "No tests requested."
    virtual void on_message(std::string_view msg) = 0;

    /// Transient progress, e.g. "Building estimate."
    virtual void on_status(std::string_view status) = 0;

    virtual void on_test_begin(std::string_view group, const RunTally& tally) = 0;
    virtual void on_test_result(const TestResult& data) = 0;

    virtual void on_warning(std::string_view what) = 0;

    /// `context` names what failed: a project, a test group, or the grader itself
    virtual void on_error(std::string_view context, const GraderError& error) = 0;

    virtual void on_summary(const RunSummary& data) = 0;

    virtual void finalize() = 0;

    VerbosityLevel get_verbosity() const { return verbosity_; }

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace autograder
