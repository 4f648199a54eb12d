#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace autograder {

/// Read a whole fixture file.
/// Throws TestIOError("Unable to <action> '<path>': <reason>") on failure.
std::string read_fixture_file(const std::filesystem::path& path, std::string_view action);

} // namespace autograder
