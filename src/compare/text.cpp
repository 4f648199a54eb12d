#include <autograder/compare/text.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

namespace {

constexpr bool is_space(char chr) {
    return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\v' || chr == '\f';
}

void append_utf8(std::string& out, unsigned char latin1) {
    // Latin-1 code points 0x80..0xFF are two UTF-8 bytes
    out += static_cast<char>(0xC0 | (latin1 >> 6));
    out += static_cast<char>(0x80 | (latin1 & 0x3F));
}

} // namespace

std::string_view rstrip(std::string_view str) {
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }

    return str;
}

std::vector<std::string_view> split_lines(std::string_view str) {
    std::vector<std::string_view> lines;

    while (true) {
        auto newline = str.find_first_of("\r\n");

        if (newline == std::string_view::npos) {
            lines.push_back(str);
            return lines;
        }

        lines.push_back(str.substr(0, newline));

        // "\r\n" is a single line break
        const bool crlf = str[newline] == '\r' && newline + 1 < str.size() && str[newline + 1] == '\n';
        str.remove_prefix(newline + (crlf ? 2 : 1));
    }
}

std::string_view first_line(std::string_view str) {
    return str.substr(0, str.find_first_of("\r\n"));
}

std::string quote(std::string_view str, Encoding encoding) {
    // Same quote selection as Python's repr
    const char quote_char = (ranges::find(str, '\'') != str.end() && ranges::find(str, '"') == str.end()) ? '"' : '\'';

    std::string out;
    out.reserve(str.size() + 2);
    out += quote_char;

    for (char chr : str) {
        const auto byte = static_cast<unsigned char>(chr);

        if (chr == quote_char || chr == '\\') {
            out += '\\';
            out += chr;
        } else if (chr == '\n') {
            out += "\\n";
        } else if (chr == '\r') {
            out += "\\r";
        } else if (chr == '\t') {
            out += "\\t";
        } else if (byte < 0x20 || byte == 0x7F) {
            out += fmt::format("\\x{:02x}", byte);
        } else if (byte < 0x80) {
            out += chr;
        } else if (encoding == Encoding::Utf8) {
            out += chr;
        } else if (byte <= 0xA0) {
            // C1 controls and the non-breaking space are not printable
            out += fmt::format("\\x{:02x}", byte);
        } else {
            append_utf8(out, byte);
        }
    }

    out += quote_char;
    return out;
}

std::string to_display(std::string_view str, Encoding encoding) {
    if (encoding == Encoding::Utf8) {
        return std::string{str};
    }

    std::string out;
    out.reserve(str.size());

    for (char chr : str) {
        const auto byte = static_cast<unsigned char>(chr);

        if (byte < 0x80) {
            out += chr;
        } else {
            append_utf8(out, byte);
        }
    }

    return out;
}

std::string with_commas(std::size_t num) {
    std::string digits = fmt::format("{}", num);

    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) {
            out += ',';
        }
        out += digits[i];
    }

    return out;
}

} // namespace autograder
