#pragma once

#include <autograder/output/serializer.hpp>
#include <autograder/test/test_case.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autograder {

/// Directory roots for one grading run
struct AssignmentContext
{
    std::filesystem::path src_dir;
    std::filesystem::path build_dir;
    std::filesystem::path data_dir;
    /// Personal test fixtures. Defaults to `<src_dir>/tests`.
    std::optional<std::filesystem::path> user_dir;
};

/// `project` selects every group of a project, `project:group` a single group
using RequestSet = std::set<std::string, std::less<>>;

/// What the orchestrator drives: a single project, or several graded together
class Assignment
{
public:
    virtual ~Assignment() = default;

    virtual bool has_context() const = 0;

    /// Must be called before any of the operations below
    virtual void set_context(const AssignmentContext& ctx) = 0;

    /// Discover the requested tests. An empty request set requests everything.
    /// Returns the number of tests discovered.
    virtual int gather_tests(const RequestSet& requests, Serializer& out) = 0;

    /// Create the build directory and its Makefile
    virtual void prepare_build_dir() = 0;

    /// Build every project that has tests. Failures are reported to `out`.
    /// Returns the number of failed builds.
    virtual int build(Serializer& out) = 0;

    /// The gathered tests of every project that built successfully, in gather order
    virtual std::vector<std::reference_wrapper<TestCase>> tests() = 0;
};

} // namespace autograder
