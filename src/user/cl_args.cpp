#include "user/cl_args.hpp"

#include "user/program_options.hpp"

#include <autograder/common/expected.hpp>
#include <autograder/logging.hpp>
#include <autograder/output/verbosity.hpp>
#include <autograder/registrars/global_registrar.hpp>
#include <autograder/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autograder {

namespace {

/// argparse reads `-1` as a negative number, so it is given its long spelling before parsing
std::vector<std::string> normalize_args(std::span<const char*> args) {
    std::vector<std::string> result{args.begin(), args.end()};

    std::replace(result.begin() + (result.empty() ? 0 : 1), result.end(), std::string{"-1"}, std::string{"--stop"});

    return result;
}

} // namespace

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args.empty() ? "grader" : args[0]), AUTOGRADER_VERSION_STRING,
                  argparse::default_arguments::help}
    , args_{normalize_args(args)} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    constexpr std::size_t MAX_LINE_WIDTH = 80;
    arg_parser_.set_usage_max_line_width(MAX_LINE_WIDTH);

    const auto assignment_names = GlobalRegistrar::get().get_assignment_names();

    arg_parser_.add_description(fmt::format("Autograder v{}", AUTOGRADER_VERSION_STRING));

    // FIXME: argparse behavior is dependant upon ORDER of chained fn calls (e.g., .flag() before .action()).

    // clang-format off
    arg_parser_.add_argument("requests")
        .nargs(argparse::nargs_pattern::any)
        .metavar("PROGRAM")
        .help("Projects or test groups (project:group) to run. All of them if none are given.");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(AUTOGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) { ++verbose_count_; })
        .append()
        .help("Increase verbosity. Once for input and output of failed tests, twice to also list successes.");

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) { ++quiet_count_; })
        .append()
        .help("Decrease verbosity, omitting the explanation of each failure");

    // Also spelled `-1`
    arg_parser_.add_argument("--stop")
        .flag()
        .store_into(opts_buffer_.stop_on_failure)
        .help("(or -1) Stop at the first failure or error. Implies -v.");

    arg_parser_.add_argument("-i", "--init")
        .flag()
        .store_into(opts_buffer_.init_only)
        .help("Create the build directory and its Makefile, then exit");

    arg_parser_.add_argument("-f", "--fresh")
        .flag()
        .store_into(opts_buffer_.fresh)
        .help("Delete the build directory before building");

    arg_parser_.add_argument("-s", "--src")
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.src_dir = opt; })
        .help(fmt::format("Directory containing the program sources (default: {})", ProgramOptions::DEFAULT_SRC_DIR));

    arg_parser_.add_argument("-b", "--build")
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.build_dir = opt; })
        .help(fmt::format("Directory to build in (default: {})", ProgramOptions::DEFAULT_BUILD_DIR));

    arg_parser_.add_argument("-a", "--archive")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.archive = opt; })
        .help("Tar archive to extract and grade. Overrides --src and --build.");

    arg_parser_.add_argument("--data")
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.data_dir = opt; })
        .help(fmt::format("Directory of reference files (default: '{}' beside the grader)",
                          ProgramOptions::DEFAULT_DATA_SUBDIR));

    auto& assignment_arg = arg_parser_.add_argument("-A", "--assignment")
        .nargs(1)
        .metavar("NAME")
        .action([this] (const std::string& opt) { opts_buffer_.assignment_name = opt; })
        // Add all assignment names to help msg, since argparse won't add choices by
        // default for some reason
        .help(fmt::format("The assignment to grade, if more than one is available\nOne of: {:n}", assignment_names));
    for (const auto& name : assignment_names) {
        assignment_arg.add_choice(name);
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    arg_parser_.add_argument("-d", "--debug")
        .flag()
        .store_into(opts_buffer_.debug)
        .help("Write debug-level messages to the log file");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    verbose_count_ = 0;
    quiet_count_ = 0;

    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (auto requests = arg_parser_.present<std::vector<std::string>>("requests")) {
        opts_buffer_.requests = std::move(*requests);
    }

    opts_buffer_.verbosity =
        verbosity_from_count(verbose_count_ - quiet_count_ + (opts_buffer_.stop_on_failure ? 1 : 0));

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println("{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace autograder
