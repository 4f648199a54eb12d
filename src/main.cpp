#include "app/grader_app.hpp"
#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <autograder/logging.hpp>
#include <autograder/registrars/global_registrar.hpp>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>

int main(int argc, const char* argv[]) {
    using namespace autograder;

    init_loggers();

    try {
        LOG_TRACE("Registered assignments: {}", GlobalRegistrar::get().get_assignment_names());

        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        const ProgramOptions options = parse_args_or_exit(args);

        init_loggers({.log_file = GraderApp::get_exe_dir() / "autograder.log", .debug = options.debug});

        GraderApp app{options};

        return app.run();
    } catch (const std::exception& ex) {
        trace_exception(ex);
    }

    return EXIT_FAILURE;
}
