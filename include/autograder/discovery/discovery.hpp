#pragma once

#include <autograder/discovery/test_group.hpp>
#include <autograder/test/test_case.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

/// Where a group's tests come from and where they run
struct DiscoveryContext
{
    std::string project;
    /// Executable name, relative to `build_dir`
    std::string program;
    std::filesystem::path build_dir;
    /// Absolute, since tests run from `build_dir`
    std::filesystem::path data_dir;
};

/// Enumerate the tests of `group` from the fixture files in `ctx.data_dir`.
/// Fixtures that are missing or incomplete are skipped with a warning.
std::vector<TestCase> discover_tests(const TestGroup& group, const DiscoveryContext& ctx);

/// Names of the files in `dir` starting with `prefix` and ending with `suffix`, sorted.
/// Throws ConfigurationError if `dir` cannot be listed.
std::vector<std::string> list_fixtures(const std::filesystem::path& dir, std::string_view prefix,
                                       std::string_view suffix);

} // namespace autograder
