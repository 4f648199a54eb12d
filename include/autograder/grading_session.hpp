/// \file
/// Defines data classes to store result data for the current run session
#pragma once

#include <autograder/common/formatters/enum.hpp> // IWYU pragma: keep
#include <autograder/subprocess/run_result.hpp>
#include <autograder/version.hpp>

#include <boost/describe/enum.hpp>
#include <gsl/util>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/fold_left.hpp>
#include <range/v3/view/transform.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autograder {

// NOLINTNEXTLINE
BOOST_DEFINE_ENUM_CLASS(Category, Regular, ExtraCredit, Personal);

constexpr std::string_view display_name(Category category) {
    switch (category) {
    case Category::Regular:
        return "Regular credit";
    case Category::ExtraCredit:
        return "Extra credit";
    case Category::Personal:
        return "Personal (not graded)";
    }

    return "<unknown>";
}

struct RunMetadata
{
    std::string_view assignment_name;
    std::string_view release;
    std::string_view version_string = AUTOGRADER_VERSION_STRING;

    std::chrono::time_point<std::chrono::system_clock> start_time = std::chrono::system_clock::now();
};

/// The outcome of one execution of one test. Discarded once reported.
struct TestResult
{
    std::string group;
    Category category{};
    double weight{};

    std::vector<std::string> command;

    bool success{};
    /// Failure reason; "" on success
    std::string summary;
    std::vector<std::string> comments;

    /// Input as shown in verbose reports
    std::optional<std::string> input;
    std::string output;

    int exit_code{};
    ProcessOutcome outcome{};

    /// Credit is all or nothing
    double awarded() const noexcept { return success ? weight : 0.0; }
};

/// Accumulated points for one test group
struct GroupScore
{
    std::string group;
    double points{};
    double score{};
    int failures{};
};

/// Per category, per group totals for one orchestration run.
/// Categories report in enum order, groups in the order they were first recorded.
class ScoreTable
{
public:
    void record(const TestResult& result) {
        GroupScore& entry = find_or_insert(result.category, result.group);

        entry.points += result.weight;
        entry.score += result.awarded();

        if (!result.success) {
            ++entry.failures;
        }
    }

    /// Count a test that could not be run to completion as a failure worth `weight`
    void record_error(Category category, const std::string& group, double weight) {
        GroupScore& entry = find_or_insert(category, group);

        entry.points += weight;
        ++entry.failures;
    }

    const std::vector<GroupScore>& groups(Category category) const { return tables_.at(index(category)); }

    bool empty(Category category) const { return groups(category).empty(); }

    GroupScore total(Category category) const {
        using ranges::fold_left, ranges::views::transform;

        const auto& table = groups(category);

        return {
            .group = "",
            .points = fold_left(table | transform(&GroupScore::points), 0.0, std::plus{}),
            .score = fold_left(table | transform(&GroupScore::score), 0.0, std::plus{}),
            .failures = fold_left(table | transform(&GroupScore::failures), 0, std::plus{}),
        };
    }

private:
    static constexpr std::size_t NUM_CATEGORIES = 3;

    static std::size_t index(Category category) { return gsl::narrow_cast<std::size_t>(category); }

    GroupScore& find_or_insert(Category category, const std::string& group) {
        auto& table = tables_.at(index(category));

        if (auto iter = ranges::find_if(table, [&group](const GroupScore& entry) { return entry.group == group; });
            iter != table.end()) {
            return *iter;
        }

        return table.emplace_back(GroupScore{.group = group});
    }

    std::array<std::vector<GroupScore>, NUM_CATEGORIES> tables_;
};

/// Test counts for one orchestration run
struct RunTally
{
    int requested{};
    int completed{};
    int failures{};
    int errors{};
};

struct RunSummary
{
    RunMetadata metadata;
    RunTally tally;
    ScoreTable scores;
};

} // namespace autograder
