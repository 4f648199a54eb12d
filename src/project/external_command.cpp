#include <autograder/project/external_command.hpp>

#include <autograder/common/error_types.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/logging.hpp>
#include <autograder/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

std::string run_command(const std::vector<std::string>& command, const std::filesystem::path& working_dir) {
    LOG_DEBUG("Running {} in {}", command, working_dir.string());

    Subprocess proc{command, working_dir};

    auto fail = [&command](std::string_view step, ErrorKind err) {
        return std::runtime_error(fmt::format("Could not {} {}: {}", step, command, err));
    };

    if (auto res = proc.start(); !res) {
        throw fail("start", res.error());
    }

    if (auto res = proc.close_stdin(); !res) {
        throw fail("close stdin of", res.error());
    }

    auto output = proc.read_all_stdout();
    if (!output) {
        throw fail("read output of", output.error());
    }

    auto exit_code = proc.wait_for_exit();
    if (!exit_code) {
        throw fail("wait for", exit_code.error());
    }

    if (!output->empty()) {
        LOG_DEBUG("Response\n{}", *output);
    }

    if (*exit_code != 0) {
        throw ExternalCommandError{command, *exit_code, std::move(output.value())};
    }

    return std::move(output.value());
}

} // namespace autograder
