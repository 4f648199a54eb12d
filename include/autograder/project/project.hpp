#pragma once

#include <autograder/discovery/test_group.hpp>
#include <autograder/output/serializer.hpp>
#include <autograder/project/assignment.hpp>
#include <autograder/test/test_case.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

/// One subject program, its test groups, and how it is built.
///
/// Groups in Category::Personal are the student's own tests, read from the user directory.
/// If none are given, one named "0" is made with the scheme of the first graded group.
class Project final : public Assignment
{
public:
    /// Throws ConfigurationError on duplicate group ids or if no graded group is given.
    /// `program` defaults to `name`.
    Project(std::string name, std::vector<TestGroup> groups, std::string program = "");

    bool has_context() const override { return ctx_.has_value(); }

    void set_context(const AssignmentContext& ctx) override;

    int gather_tests(const RequestSet& requests, Serializer& out) override;

    void prepare_build_dir() override;

    int build(Serializer& out) override;

    std::vector<std::reference_wrapper<TestCase>> tests() override;

    const std::string& get_name() const { return name_; }

    const std::string& get_program() const { return program_; }

    const std::vector<TestGroup>& get_groups() const { return groups_; }

    const std::vector<TestGroup>& get_user_groups() const { return user_groups_; }

    bool is_ready() const { return ready_; }

    /// Contents of the Makefile placed in the build directory
    static std::string makefile_template(std::string_view src_path);

private:
    bool is_requested(const TestGroup& group, const RequestSet& requests) const;

    void gather_group(const TestGroup& group, const std::filesystem::path& data_dir);

    const AssignmentContext& context() const;

    std::string name_;
    std::string program_;
    std::vector<TestGroup> groups_;
    std::vector<TestGroup> user_groups_;

    std::optional<AssignmentContext> ctx_;

    bool ready_ = false;
    std::vector<TestCase> tests_;
};

} // namespace autograder
