#pragma once

#include <string>
#include <vector>

namespace autograder {

/// The failure reason for one test run, and the lines supporting it.
/// A run succeeds if and only if no summary was ever set.
struct Diagnostic
{
    std::string summary;
    std::vector<std::string> comments;

    bool is_set() const { return !summary.empty(); }

    void fail(std::string reason) { summary = std::move(reason); }
};

} // namespace autograder
