#include <autograder/compare/output_verifier.hpp>

#include <autograder/compare/diagnostic.hpp>
#include <autograder/compare/fixture_file.hpp>
#include <autograder/compare/text.hpp>
#include <autograder/logging.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

LineDiff diff_lines(std::string_view reference, std::string_view produced, std::size_t error_limit) {
    const auto ref_lines = split_lines(rstrip(reference));
    const auto out_lines = split_lines(rstrip(produced));

    LineDiff diff;

    const std::size_t common = std::min(ref_lines.size(), out_lines.size());

    for (std::size_t i = 0; i < common; ++i) {
        if (ref_lines[i] == out_lines[i]) {
            continue;
        }

        if (error_limit == 0 || diff.mismatches.size() < error_limit) {
            diff.mismatches.push_back({.line = i + 1, .expected = ref_lines[i], .received = out_lines[i]});
        } else {
            ++diff.additional_errors;
        }
    }

    if (out_lines.size() > ref_lines.size()) {
        diff.extra_lines = out_lines.size() - ref_lines.size();
    } else if (ref_lines.size() > out_lines.size()) {
        diff.missing = LineMismatch{.line = common + 1, .expected = ref_lines[common], .received = {}};
    }

    return diff;
}

std::vector<std::string> LineDiff::describe(Encoding encoding) const {
    std::vector<std::string> lines;

    for (const auto& mismatch : mismatches) {
        lines.push_back(fmt::format("line {}", with_commas(mismatch.line)));
        lines.push_back(fmt::format("  expected: {}", quote(mismatch.expected, encoding)));
        lines.push_back(fmt::format("  received: {}", quote(mismatch.received, encoding)));
    }

    if (additional_errors > 0) {
        lines.push_back(fmt::format("{} additional errors", with_commas(additional_errors)));
    }

    if (extra_lines > 0) {
        lines.push_back(fmt::format("{} extra lines in output", with_commas(extra_lines)));
    } else if (missing) {
        lines.push_back(fmt::format("line {}", with_commas(missing->line)));
        lines.push_back(fmt::format("  expected: {}", quote(missing->expected, encoding)));
        lines.push_back("  received end of file");
    }

    return lines;
}

void LiteralLineVerifier::verify(std::string_view output, Encoding encoding, Diagnostic& diag) const {
    const auto received = rstrip(first_line(output));

    if (received == expected_) {
        return;
    }

    diag.fail("incorrect output");
    diag.comments.push_back(fmt::format("expected: {}", to_display(expected_, encoding)));
    diag.comments.push_back(fmt::format("received: {}", to_display(received, encoding)));
}

void FileLineVerifier::verify(std::string_view output, Encoding encoding, Diagnostic& diag) const {
    diag.comments.push_back(fmt::format("reference file: {}", quote(reference_file_.string())));

    const std::string reference = read_fixture_file(reference_file_, "open reference file");

    const LineDiff diff = diff_lines(reference, output, error_limit_);

    if (diff.matches()) {
        return;
    }

    LOG_DEBUG("Output differs from {} ({} mismatched lines)", reference_file_.string(),
              diff.mismatches.size() + diff.additional_errors);

    diag.fail("incorrect output");

    auto detail = diff.describe(encoding);
    diag.comments.insert(diag.comments.end(), detail.begin(), detail.end());
}

} // namespace autograder
