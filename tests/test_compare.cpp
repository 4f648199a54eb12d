#include "test_helpers.hpp"

#include <autograder/compare/diagnostic.hpp>
#include <autograder/compare/output_verifier.hpp>
#include <autograder/exceptions.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <vector>

using namespace autograder;

using Lines = std::vector<std::string>;

TEST_CASE("Matching output produces no differences") {
    auto diff = diff_lines("1\n2\n3\n", "1\n2\n3   \n\n", 5);

    REQUIRE(diff.matches());
    REQUIRE(diff.describe(Encoding::Latin1).empty());
}

TEST_CASE("Mismatched lines are reported with their line numbers") {
    auto diff = diff_lines("1\n2\n3\n", "1\n2\n9\n", 5);

    REQUIRE_FALSE(diff.matches());
    REQUIRE(diff.mismatches.size() == 1);
    REQUIRE(diff.mismatches[0].line == 3);
    REQUIRE(diff.describe(Encoding::Latin1) == Lines{"line 3", "  expected: '3'", "  received: '9'"});
}

TEST_CASE("Mismatches beyond the error limit are only counted") {
    auto diff = diff_lines("a\nb\nc\nd\n", "w\nx\ny\nz\n", 2);

    REQUIRE(diff.mismatches.size() == 2);
    REQUIRE(diff.additional_errors == 2);
    REQUIRE(diff.describe(Encoding::Latin1) == Lines{
                                                   "line 1",
                                                   "  expected: 'a'",
                                                   "  received: 'w'",
                                                   "line 2",
                                                   "  expected: 'b'",
                                                   "  received: 'x'",
                                                   "2 additional errors",
                                               });
}

TEST_CASE("An error limit of zero reports every mismatch") {
    auto diff = diff_lines("a\nb\nc\n", "x\ny\nz\n", 0);

    REQUIRE(diff.mismatches.size() == 3);
    REQUIRE(diff.additional_errors == 0);
}

TEST_CASE("CRLF line endings compare equal to plain newlines") {
    SECTION("in the reference") {
        REQUIRE(diff_lines("1\r\n2\r\n3\r\n", "1\n2\n3\n", 5).matches());
    }

    SECTION("in the output") {
        REQUIRE(diff_lines("1\n2\n3\n", "1\r\n2\r\n3\r\n", 5).matches());
    }

    SECTION("a mismatch keeps its line number") {
        auto diff = diff_lines("1\r\n2\r\n3\r\n", "1\r\n2\r\n9\r\n", 5);

        REQUIRE(diff.describe(Encoding::Latin1) == Lines{"line 3", "  expected: '3'", "  received: '9'"});
    }
}

TEST_CASE("Extra output lines are counted") {
    auto diff = diff_lines("1\n", "1\n2\n3\n", 5);

    REQUIRE(diff.extra_lines == 2);
    REQUIRE(diff.describe(Encoding::Latin1) == Lines{"2 extra lines in output"});
}

TEST_CASE("Output ending early reports the first missing line") {
    auto diff = diff_lines("1\n2\n3\n", "1\n", 5);

    REQUIRE(diff.missing.has_value());
    REQUIRE(diff.missing->line == 2);
    REQUIRE(diff.describe(Encoding::Latin1) == Lines{"line 2", "  expected: '2'", "  received end of file"});
}

TEST_CASE("Literal verifier compares only the first line") {
    const LiteralLineVerifier verifier{"XLII"};

    SECTION("correct") {
        Diagnostic diag;
        verifier.verify("XLII  \nignored\n", Encoding::Latin1, diag);

        REQUIRE_FALSE(diag.is_set());
        REQUIRE(diag.comments.empty());
    }

    SECTION("correct with a CRLF line ending") {
        Diagnostic diag;
        verifier.verify("XLII\r\n", Encoding::Latin1, diag);

        REQUIRE_FALSE(diag.is_set());
    }

    SECTION("incorrect") {
        Diagnostic diag;
        verifier.verify("XLI\n", Encoding::Latin1, diag);

        REQUIRE(diag.summary == "incorrect output");
        REQUIRE(diag.comments == Lines{"expected: XLII", "received: XLI"});
    }
}

TEST_CASE("File verifier names its reference file") {
    TempDir dir;
    const auto ref = dir.write("ref.1.txt", "1\n2\n3\n");

    const FileLineVerifier verifier{ref, 5};

    SECTION("even when the output matches") {
        Diagnostic diag;
        verifier.verify("1\n2\n3\n", Encoding::Latin1, diag);

        REQUIRE_FALSE(diag.is_set());
        REQUIRE(diag.comments == Lines{"reference file: " + quote(ref.string())});
    }

    SECTION("followed by the differences") {
        Diagnostic diag;
        verifier.verify("1\n2\n9\n", Encoding::Latin1, diag);

        REQUIRE(diag.summary == "incorrect output");
        REQUIRE(diag.comments == Lines{
                                     "reference file: " + quote(ref.string()),
                                     "line 3",
                                     "  expected: '3'",
                                     "  received: '9'",
                                 });
    }
}

TEST_CASE("File verifier accepts a reference saved with CRLF endings") {
    TempDir dir;
    const auto ref = dir.write("ref.1.txt", "1\r\n2\r\n3\r\n");

    Diagnostic diag;
    FileLineVerifier{ref, 5}.verify("1\n2\n3\n", Encoding::Latin1, diag);

    REQUIRE_FALSE(diag.is_set());
}

TEST_CASE("File verifier with a missing reference file throws TestIOError") {
    TempDir dir;
    const FileLineVerifier verifier{dir / "ref.404.txt", 5};

    Diagnostic diag;
    REQUIRE_THROWS_AS(verifier.verify("anything", Encoding::Latin1, diag), TestIOError);
}
