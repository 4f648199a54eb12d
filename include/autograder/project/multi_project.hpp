#pragma once

#include <autograder/output/serializer.hpp>
#include <autograder/project/assignment.hpp>
#include <autograder/project/project.hpp>
#include <autograder/test/test_case.hpp>

#include <functional>
#include <vector>

namespace autograder {

/// Several projects graded together, each in its own subdirectory of every root
class MultiProject final : public Assignment
{
public:
    /// Throws ConfigurationError on duplicate project names
    explicit MultiProject(std::vector<Project> projects);

    bool has_context() const override { return has_context_; }

    /// Project `p` receives `<root>/<p>` for the source, build and data roots
    void set_context(const AssignmentContext& ctx) override;

    int gather_tests(const RequestSet& requests, Serializer& out) override;

    void prepare_build_dir() override;

    int build(Serializer& out) override;

    std::vector<std::reference_wrapper<TestCase>> tests() override;

    const std::vector<Project>& get_projects() const { return projects_; }

private:
    std::vector<Project> projects_;
    bool has_context_ = false;
};

} // namespace autograder
