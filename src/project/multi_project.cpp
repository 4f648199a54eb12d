#include <autograder/project/multi_project.hpp>

#include <autograder/exceptions.hpp>
#include <autograder/logging.hpp>
#include <autograder/output/serializer.hpp>
#include <autograder/project/assignment.hpp>
#include <autograder/project/project.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autograder {

MultiProject::MultiProject(std::vector<Project> projects)
    : projects_{std::move(projects)} {
    std::map<std::string, int> counts;
    for (const auto& project : projects_) {
        ++counts[project.get_name()];
    }

    std::vector<std::string> dups;
    for (const auto& [name, count] : counts) {
        if (count > 1) {
            dups.push_back(name);
        }
    }

    if (!dups.empty()) {
        throw ConfigurationError{fmt::format("Duplicate project names {}", dups)};
    }
}

void MultiProject::set_context(const AssignmentContext& ctx) {
    for (auto& project : projects_) {
        const auto& name = project.get_name();

        project.set_context({
            .src_dir = ctx.src_dir / name,
            .build_dir = ctx.build_dir / name,
            .data_dir = ctx.data_dir / name,
            .user_dir = std::nullopt,
        });
    }

    has_context_ = true;
}

int MultiProject::gather_tests(const RequestSet& requests, Serializer& out) {
    ASSERT(has_context_, "MultiProject used without context");

    int count = 0;

    for (auto& project : projects_) {
        count += project.gather_tests(requests, out);
    }

    LOG_INFO("Total tests: {}", count);
    return count;
}

void MultiProject::prepare_build_dir() {
    for (auto& project : projects_) {
        project.prepare_build_dir();
    }
}

int MultiProject::build(Serializer& out) {
    int errors = 0;

    for (auto& project : projects_) {
        errors += project.build(out);
    }

    return errors;
}

std::vector<std::reference_wrapper<TestCase>> MultiProject::tests() {
    std::vector<std::reference_wrapper<TestCase>> all;

    for (auto& project : projects_) {
        auto tests = project.tests();
        all.insert(all.end(), tests.begin(), tests.end());
    }

    return all;
}

} // namespace autograder
