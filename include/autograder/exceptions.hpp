#pragma once

#include <autograder/compare/text.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autograder {

/// Base for orchestration-level errors, i.e. anything that is not a per-test grading outcome
class GraderError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

    /// Lines to show the user, given what the error occured in (a project, a test group, "grader")
    virtual std::vector<std::string> report(std::string_view context) const {
        return {fmt::format("{}: {}", context, what())};
    }
};

/// Missing or invalid directories, duplicate identifiers, unusable paths. Fatal to the run.
class ConfigurationError : public GraderError
{
public:
    using GraderError::GraderError;
};

/// A test's reference or input file could not be read. Fatal to that test only.
class TestIOError : public GraderError
{
public:
    using GraderError::GraderError;
};

/// An external collaborator (make, tar) exited with a nonzero status
class ExternalCommandError : public GraderError
{
public:
    ExternalCommandError(std::vector<std::string> command, int return_code, std::string output)
        : GraderError{fmt::format("error running {} (return code {})", quote(command.at(0)), return_code)}
        , command_{std::move(command)}
        , return_code_{return_code}
        , output_{std::move(output)} {}

    std::vector<std::string> report(std::string_view context) const override {
        std::vector<std::string> lines{fmt::format("{}: {}", context, what())};

        if (command_.size() > 1) {
            lines.push_back(fmt::format("  arguments {}", std::vector(command_.begin() + 1, command_.end())));
        }

        if (!output_.empty()) {
            lines.push_back(to_display(output_));
        }

        return lines;
    }

    const std::vector<std::string>& get_command() const { return command_; }

    int get_return_code() const { return return_code_; }

    const std::string& get_output() const { return output_; }

private:
    std::vector<std::string> command_;
    int return_code_;
    std::string output_;
};

} // namespace autograder
