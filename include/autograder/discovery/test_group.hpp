#pragma once

#include <autograder/common/formatters/enum.hpp> // IWYU pragma: keep
#include <autograder/grading_session.hpp>
#include <autograder/test/test_spec.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <variant>

namespace autograder {

/// One file, `<prefix><id><suffix>`, of alternating lines: an argument, then the expected first line of output.
/// Each pair runs `./<prog> <argument>`.
struct TranscriptScheme
{
    std::string prefix = "tests";
    std::string suffix = ".txt";
};

// NOLINTNEXTLINE
BOOST_DEFINE_ENUM_CLASS(InputMode, Argument, Stdin);

/// Pairs of `<ref_prefix><n><suffix>` reference files and `<arg_prefix><n><suffix>` input files.
/// With a group id, the prefixes become `<prefix><id>.`.
///
/// InputMode::Argument runs `./<prog> <input file>`; InputMode::Stdin runs `./<prog>` and writes the
/// input file to stdin.
struct PairedFileScheme
{
    InputMode input_mode = InputMode::Argument;
    std::string arg_prefix = "test.";
    std::string ref_prefix = "ref.";
    std::string suffix = ".txt";
};

/// Reference files `<ref_prefix><n><suffix>`, each with two companions that are staged into the
/// build directory before running `./<prog> <train_name> <data_name>`.
/// With a group id, the prefixes become `<prefix><id>.`.
struct StagedFileScheme
{
    std::string ref_prefix = "ref.";
    std::string train_prefix = "train.";
    std::string data_prefix = "data.";
    std::string suffix = ".txt";

    std::string train_name = "train";
    std::string data_name = "data";
};

using DiscoveryScheme = std::variant<TranscriptScheme, PairedFileScheme, StagedFileScheme>;

/// A named bundle of tests sharing discovery rules, weight and category
struct TestGroup
{
    std::string id;
    DiscoveryScheme scheme;
    double weight = 1.0;
    Category category = Category::Regular;
    /// Defaults to `id`
    std::string name;
    TestLimits limits;

    const std::string& get_name() const { return name.empty() ? id : name; }

    /// `project:name`, or `project` for an unnamed group
    std::string report_name(std::string_view project) const {
        if (get_name().empty()) {
            return std::string{project};
        }

        return fmt::format("{}:{}", project, get_name());
    }
};

} // namespace autograder
