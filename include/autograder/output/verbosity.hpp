#pragma once

namespace autograder {

/// Net verbosity, from `-v`, `-q` and `-1` on the command line
enum class VerbosityLevel {
    Quiet,   ///< Failed tests with their summary only
    Summary, ///< Also the comments explaining each failure
    All,     ///< Also the input and captured output of each failure
    Extra,   ///< Also every successful test, reported as "correct"
};

/// Map a net `-v` count (minus `-q` count) onto a level
constexpr VerbosityLevel verbosity_from_count(int net_count) {
    using enum VerbosityLevel;

    if (net_count < 0) {
        return Quiet;
    }
    if (net_count == 0) {
        return Summary;
    }
    if (net_count == 1) {
        return All;
    }
    return Extra;
}

constexpr bool should_output_comments(VerbosityLevel level) {
    return level >= VerbosityLevel::Summary;
}

constexpr bool should_output_input_and_output(VerbosityLevel level) {
    return level >= VerbosityLevel::All;
}

constexpr bool should_output_successes(VerbosityLevel level) {
    return level >= VerbosityLevel::Extra;
}

} // namespace autograder
