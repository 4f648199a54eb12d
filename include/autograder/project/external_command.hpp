#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace autograder {

/// Run a collaborator (make, tar) in `working_dir` to completion, with no time or output limit.
/// Returns its combined stdout and stderr.
/// Throws ExternalCommandError if it exits with a nonzero status.
std::string run_command(const std::vector<std::string>& command, const std::filesystem::path& working_dir);

} // namespace autograder
