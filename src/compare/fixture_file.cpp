#include <autograder/compare/fixture_file.hpp>

#include <autograder/compare/text.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/logging.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace autograder {

std::string read_fixture_file(const std::filesystem::path& path, std::string_view action) {
    LOG_DEBUG("Opening {}", quote(path.string()));

    errno = 0;
    std::ifstream file{path, std::ios::binary};

    if (!file) {
        const int err = errno == 0 ? ENOENT : errno;
        throw TestIOError{fmt::format("Unable to {} {}: {}", action, quote(path.string()), get_err_msg(err))};
    }

    std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

    if (file.bad()) {
        throw TestIOError{fmt::format("Unable to {} {}: read error", action, quote(path.string()))};
    }

    return contents;
}

} // namespace autograder
