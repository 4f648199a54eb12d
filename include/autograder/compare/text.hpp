#pragma once

#include <autograder/common/formatters/enum.hpp> // IWYU pragma: keep

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

/// How subject output is interpreted for display.
/// Latin-1 maps every byte to a character, so no output can fail to decode.
// NOLINTNEXTLINE
BOOST_DEFINE_ENUM_CLASS(Encoding, Latin1, Utf8);

/// Remove trailing ASCII whitespace
std::string_view rstrip(std::string_view str);

/// Split on line breaks, where "\r\n", "\r" and "\n" each end a line.
/// "" gives one empty line, "a\n" gives {"a", ""}.
std::vector<std::string_view> split_lines(std::string_view str);

/// Everything up to (not including) the first line break
std::string_view first_line(std::string_view str);

/// Quote `str` for a diagnostic, escaping quotes, backslashes and unprintable characters
std::string quote(std::string_view str, Encoding encoding = Encoding::Latin1);

/// Convert subject text to UTF-8 for display
std::string to_display(std::string_view str, Encoding encoding = Encoding::Latin1);

/// Format a count with thousands separators, e.g. 12345 -> "12,345"
std::string with_commas(std::size_t num);

} // namespace autograder
