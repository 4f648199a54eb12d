#pragma once

#include "user/program_options.hpp"

#include <autograder/common/class_traits.hpp>

#include <utility>

namespace autograder {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Returns the process exit code
    int run() { return run_impl(); }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace autograder
