#pragma once

#include <autograder/compare/diagnostic.hpp>
#include <autograder/compare/text.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

struct LineMismatch
{
    /// 1-based
    std::size_t line;
    std::string_view expected;
    std::string_view received;
};

/// Line-by-line comparison of produced output against a reference.
/// Views refer into the strings passed to `diff_lines`.
struct LineDiff
{
    /// At most `error_limit` entries (unbounded if 0), in line order
    std::vector<LineMismatch> mismatches;

    /// Mismatches beyond the error limit
    std::size_t additional_errors{};

    /// Output lines past the end of the reference
    std::size_t extra_lines{};

    /// First reference line the output ended before. `received` is empty.
    std::optional<LineMismatch> missing;

    bool matches() const { return mismatches.empty() && extra_lines == 0 && !missing.has_value(); }

    /// Comment lines describing the differences
    std::vector<std::string> describe(Encoding encoding) const;
};

/// Both sides have trailing whitespace removed and are split on '\n' before pairing lines up.
LineDiff diff_lines(std::string_view reference, std::string_view produced, std::size_t error_limit);

/// Decides whether a test's output is correct
class OutputVerifier
{
public:
    virtual ~OutputVerifier() = default;

    /// Sets a summary on `diag` if the output is wrong. May throw TestIOError.
    virtual void verify(std::string_view output, Encoding encoding, Diagnostic& diag) const = 0;
};

/// Only the first line of output, trailing whitespace removed, is compared to a literal line
class LiteralLineVerifier final : public OutputVerifier
{
public:
    explicit LiteralLineVerifier(std::string expected)
        : expected_{std::move(expected)} {}

    void verify(std::string_view output, Encoding encoding, Diagnostic& diag) const override;

    const std::string& get_expected() const { return expected_; }

private:
    std::string expected_;
};

/// Full output is compared to a reference file, reporting at most `error_limit` mismatched lines.
/// The reference file is named in the comments whether or not the output matches.
class FileLineVerifier final : public OutputVerifier
{
public:
    FileLineVerifier(std::filesystem::path reference_file, std::size_t error_limit)
        : reference_file_{std::move(reference_file)}
        , error_limit_{error_limit} {}

    void verify(std::string_view output, Encoding encoding, Diagnostic& diag) const override;

    const std::filesystem::path& get_reference_file() const { return reference_file_; }

private:
    std::filesystem::path reference_file_;
    std::size_t error_limit_;
};

} // namespace autograder
