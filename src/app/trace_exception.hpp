#pragma once

#include <autograder/logging.hpp>

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <exception>
#include <iostream>
#include <string>

namespace autograder {

/// Log an exception that escaped to the top level, along with where it was thrown from.
/// Must be called from within a catch handler.
inline void trace_exception(const std::exception& exception) {
    boost::stacktrace::stacktrace trace = boost::stacktrace::stacktrace::from_current_exception();
    std::string except_str = fmt::format("Unhandled exception: {}", exception.what());

    std::string stacktrace_str = fmt::to_string(fmt::streamed(trace));
    LOG_FATAL("{}\nStacktrace:\n{}", except_str, stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);

    fmt::println(std::cerr, "grader: internal error");
}

} // namespace autograder
