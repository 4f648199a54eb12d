#pragma once

#include <autograder/output/verbosity.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

struct ProgramOptions
{

    // ###### Argument fields

    /// Net of -v, -q and -1. See \ref VerbosityLevel
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// Only needed when more than one assignment is compiled in
    std::optional<std::string> assignment_name;

    /// `project` or `project:group`. Empty to run everything.
    std::vector<std::string> requests;

    /// Stop at the first failed test or error
    bool stop_on_failure = false;

    /// Prepare the build directory, but do not build or test
    bool init_only = false;

    /// Delete the build directory first
    bool fresh = false;

    bool debug = false;

    std::filesystem::path src_dir = DEFAULT_SRC_DIR;
    std::filesystem::path build_dir = DEFAULT_BUILD_DIR;

    /// Tar archive containing `src_dir`. Overrides -s and -b.
    std::optional<std::filesystem::path> archive;

    /// Fixture root. Defaults to `data` beside the grader executable.
    std::optional<std::filesystem::path> data_dir;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_SRC_DIR = "src";
    static constexpr std::string_view DEFAULT_BUILD_DIR = "build";
    static constexpr std::string_view DEFAULT_DATA_SUBDIR = "data";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;
};

} // namespace autograder

template <>
struct fmt::formatter<::autograder::ProgramOptions>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const ::autograder::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, assignment={}, requests={}, stop={}, init={}, fresh={}, debug={}, "
                              "src={}, build={}, archive={}, data={}, color_opt={}}}",
                              fmt::underlying(from.verbosity), from.assignment_name.value_or("<none>"), from.requests,
                              from.stop_on_failure, from.init_only, from.fresh, from.debug, from.src_dir.string(),
                              from.build_dir.string(),
                              from.archive.value_or("<none>").string(), from.data_dir.value_or("<default>").string(),
                              fmt::underlying(from.colorize_option));
    }
};
