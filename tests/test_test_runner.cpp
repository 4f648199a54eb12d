#include "test_helpers.hpp"

#include "output/plaintext_serializer.hpp"
#include "test_runner.hpp"
#include "user/program_options.hpp"

#include <autograder/discovery/test_group.hpp>
#include <autograder/grading_session.hpp>
#include <autograder/output/verbosity.hpp>
#include <autograder/project/project.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

using namespace autograder;
using Catch::Matchers::ContainsSubstring;

namespace {

/// A program that prints its first argument
constexpr std::string_view ECHO_MAKEFILE = "roman:\n"
                                           "\tprintf '#!/bin/sh\\necho \"$$1\"\\n' > roman\n"
                                           "\tchmod +x roman\n";

struct Fixture
{
    Fixture() {
        root.write("src/Makefile", ECHO_MAKEFILE);
        // The first test passes, the second one fails
        root.write("data/tests.txt", "I\nI\nII\n2\n");
    }

    AssignmentContext context() const {
        return {.src_dir = root / "src", .build_dir = root / "build", .data_dir = root / "data"};
    }

    TempDir root;
    StringSink sink;
    std::shared_ptr<PlainTextSerializer> serializer = std::make_shared<PlainTextSerializer>(
        sink, sink, ProgramOptions::ColorizeOpt::Never, VerbosityLevel::Summary, false);
    Project project{"roman", {TestGroup{.scheme = TranscriptScheme{}, .weight = 2}}};
    AssignmentRunner runner{project, serializer, RunMetadata{"PA1", "1"}};
};

} // namespace

TEST_CASE_METHOD(Fixture, "A full run builds, tests and scores") {
    auto summary = runner.run(context(), {});

    REQUIRE(summary.tally.requested == 2);
    REQUIRE(summary.tally.completed == 2);
    REQUIRE(summary.tally.failures == 1);
    REQUIRE(summary.tally.errors == 0);

    const auto total = summary.scores.total(Category::Regular);
    REQUIRE(total.points == 4.0);
    REQUIRE(total.score == 2.0);

    REQUIRE_THAT(sink.contents, ContainsSubstring("roman: incorrect output\n   arguments ['./roman', 'II']\n"));
    REQUIRE_THAT(sink.contents, ContainsSubstring("Tests performed: 2 of 2\n"));
    REQUIRE_THAT(sink.contents, ContainsSubstring("  roman    4.0      1   2.0\n"));
}

TEST_CASE_METHOD(Fixture, "Stopping at the first failure skips the report") {
    auto summary = runner.run(context(), {.stop_on_failure = true});

    REQUIRE(summary.tally.completed == 2);
    REQUIRE(summary.tally.failures == 1);
    REQUIRE_THAT(sink.contents, ContainsSubstring("grader: aborting. Completed 2 of 2."));
    REQUIRE_THAT(sink.contents, !ContainsSubstring("Tests performed"));
}

TEST_CASE_METHOD(Fixture, "Init only prepares the build directory") {
    auto summary = runner.run(context(), {.init_only = true});

    REQUIRE(summary.tally.completed == 0);
    REQUIRE(std::filesystem::exists(root / "build" / "Makefile"));
    REQUIRE_FALSE(std::filesystem::exists(root / "build" / "roman"));
}

TEST_CASE_METHOD(Fixture, "Requesting nothing that exists runs nothing") {
    auto summary = runner.run(context(), {.requests = {"adder"}});

    REQUIRE(summary.tally.requested == 0);
    REQUIRE_THAT(sink.contents, ContainsSubstring("No tests requested."));
    REQUIRE_FALSE(std::filesystem::exists(root / "build"));
}

TEST_CASE_METHOD(Fixture, "A failed build counts as an error and runs no tests") {
    root.write("src/Makefile", "roman:\n\t@exit 1\n");

    SECTION("continuing") {
        auto summary = runner.run(context(), {});

        REQUIRE(summary.tally.errors == 1);
        REQUIRE(summary.tally.completed == 0);
        REQUIRE_THAT(sink.contents, ContainsSubstring("Tests performed: 0 of 2\n"));
    }

    SECTION("stopping") {
        auto summary = runner.run(context(), {.stop_on_failure = true});

        REQUIRE(summary.tally.errors == 1);
        REQUIRE_THAT(sink.contents, ContainsSubstring("grader: abort."));
    }
}

TEST_CASE_METHOD(Fixture, "A test whose reference file vanished is an error") {
    root.write("data/ref.1.txt", "I\n");
    root.write("data/test.1.txt", "I\n");

    Project paired{"roman", {TestGroup{.scheme = PairedFileScheme{}}}};
    AssignmentRunner paired_runner{paired, serializer, RunMetadata{"PA1", "1"}};

    // Discovery sees the reference file; it is gone by the time the test runs
    root.write("src/Makefile", std::string{ECHO_MAKEFILE} + "\trm -f " + (root / "data" / "ref.1.txt").string() + "\n");

    auto summary = paired_runner.run(context(), {});

    REQUIRE(summary.tally.errors == 1);
    REQUIRE(summary.tally.completed == 0);
    REQUIRE(summary.scores.total(Category::Regular).points == 1.0);
    REQUIRE_THAT(sink.contents, ContainsSubstring("roman: Unable to open reference file"));
}

TEST_CASE_METHOD(Fixture, "Input files are only read when the report shows them") {
    const auto input = root.write("data/test.1.txt", "I\n");

    Project paired{"roman", {TestGroup{.scheme = PairedFileScheme{}}}};

    SECTION("a passing test does not need its input file after the run") {
        // The subject only prints the path it was given
        root.write("data/ref.1.txt", input.string() + "\n");
        root.write("src/Makefile", std::string{ECHO_MAKEFILE} + "\trm -f " + input.string() + "\n");

        AssignmentRunner paired_runner{paired, serializer, RunMetadata{"PA1", "1"}};
        auto summary = paired_runner.run(context(), {});

        REQUIRE(summary.tally.errors == 0);
        REQUIRE(summary.tally.failures == 0);
        REQUIRE(summary.tally.completed == 1);
    }

    SECTION("a failing test shows its input at full verbosity") {
        root.write("data/ref.1.txt", "not the path\n");

        auto verbose = std::make_shared<PlainTextSerializer>(sink, sink, ProgramOptions::ColorizeOpt::Never,
                                                             VerbosityLevel::All, false);
        AssignmentRunner paired_runner{paired, verbose, RunMetadata{"PA1", "1"}};
        auto summary = paired_runner.run(context(), {});

        REQUIRE(summary.tally.failures == 1);
        REQUIRE_THAT(sink.contents, ContainsSubstring("\ninput\n-----\nI\n-----\n"));
    }
}
