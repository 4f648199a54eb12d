#include "test_helpers.hpp"

#include <autograder/compare/output_verifier.hpp>
#include <autograder/discovery/discovery.hpp>
#include <autograder/discovery/test_group.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/test/input_delivery.hpp>
#include <autograder/test/test_case.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace autograder;

using Command = std::vector<std::string>;

namespace {

DiscoveryContext make_context(const TempDir& data) {
    return {.project = "roman", .program = "roman", .build_dir = "/tmp/build", .data_dir = data.path()};
}

} // namespace

TEST_CASE("Transcript files give one test per pair of lines") {
    TempDir data;
    data.write("tests.txt", "IV\n4\nXLII\n42\n");

    auto tests = discover_tests(TestGroup{.scheme = TranscriptScheme{}}, make_context(data));

    REQUIRE(tests.size() == 2);
    REQUIRE(tests[0].get_group() == "roman");
    REQUIRE(tests[0].get_spec().get_command() == Command{"./roman", "IV"});
    REQUIRE(tests[0].get_spec().get_working_dir() == "/tmp/build");
    REQUIRE(tests[1].get_spec().get_command() == Command{"./roman", "XLII"});

    const auto* verifier = dynamic_cast<const LiteralLineVerifier*>(&tests[1].get_verifier());
    REQUIRE(verifier != nullptr);
    REQUIRE(verifier->get_expected() == "42");
}

TEST_CASE("A transcript's unpaired last line is ignored") {
    TempDir data;
    data.write("tests.2.txt", "I\n1\nII");

    auto tests = discover_tests(TestGroup{.id = "2", .scheme = TranscriptScheme{.suffix = ".txt"}, .name = "2"},
                                make_context(data));

    // "tests" + "2" + ".txt" -- the group id is appended directly
    REQUIRE(tests.empty());

    data.write("tests2.txt", "I\n1\nII");
    tests = discover_tests(TestGroup{.id = "2", .scheme = TranscriptScheme{}}, make_context(data));

    REQUIRE(tests.size() == 1);
    REQUIRE(tests[0].get_group() == "roman:2");
}

TEST_CASE("A missing transcript gives no tests") {
    TempDir data;

    REQUIRE(discover_tests(TestGroup{.scheme = TranscriptScheme{}}, make_context(data)).empty());
}

TEST_CASE("Paired files are matched by their suffix") {
    TempDir data;
    data.write("ref.1.txt", "a\n");
    data.write("ref.2.txt", "b\n");
    data.write("test.1.txt", "in\n");

    SECTION("passed as an argument") {
        auto tests = discover_tests(TestGroup{.scheme = PairedFileScheme{}}, make_context(data));

        REQUIRE(tests.size() == 1);
        REQUIRE(tests[0].get_spec().get_command() == Command{"./roman", (data / "test.1.txt").string()});
        REQUIRE(dynamic_cast<const ArgumentFileInput*>(&tests[0].get_input()) != nullptr);

        const auto* verifier = dynamic_cast<const FileLineVerifier*>(&tests[0].get_verifier());
        REQUIRE(verifier != nullptr);
        REQUIRE(verifier->get_reference_file() == data / "ref.1.txt");
    }

    SECTION("sent on stdin") {
        auto tests = discover_tests(TestGroup{.scheme = PairedFileScheme{.input_mode = InputMode::Stdin}},
                                    make_context(data));

        REQUIRE(tests.size() == 1);
        REQUIRE(tests[0].get_spec().get_command() == Command{"./roman"});
        REQUIRE(dynamic_cast<const StdinFileInput*>(&tests[0].get_input()) != nullptr);
    }
}

TEST_CASE("Paired files run in sorted order") {
    TempDir data;
    for (const auto* num : {"2", "10", "1"}) {
        data.write(std::string{"ref."} + num + ".txt", "");
        data.write(std::string{"test."} + num + ".txt", "");
    }

    auto tests = discover_tests(TestGroup{.scheme = PairedFileScheme{}}, make_context(data));

    REQUIRE(tests.size() == 3);
    REQUIRE(tests[0].get_spec().get_command().back() == (data / "test.1.txt").string());
    REQUIRE(tests[1].get_spec().get_command().back() == (data / "test.10.txt").string());
    REQUIRE(tests[2].get_spec().get_command().back() == (data / "test.2.txt").string());
}

TEST_CASE("Group ids select prefixed fixtures") {
    TempDir data;
    data.write("ref.1.txt", "");
    data.write("test.1.txt", "");
    data.write("ref.ec.1.txt", "");
    data.write("test.ec.1.txt", "");

    auto tests = discover_tests(TestGroup{.id = "ec", .scheme = PairedFileScheme{}, .category = Category::ExtraCredit},
                                make_context(data));

    REQUIRE(tests.size() == 1);
    REQUIRE(tests[0].get_group() == "roman:ec");
    REQUIRE(tests[0].get_category() == Category::ExtraCredit);
}

TEST_CASE("Staged file tests need all three files") {
    TempDir data;
    data.write("ref.1.txt", "");
    data.write("train.1.txt", "");
    data.write("data.1.txt", "");
    data.write("ref.2.txt", "");
    data.write("data.2.txt", "");

    auto ctx = make_context(data);
    ctx.program = "estimate";

    auto tests = discover_tests(TestGroup{.scheme = StagedFileScheme{}, .weight = 5}, ctx);

    REQUIRE(tests.size() == 1);
    REQUIRE(tests[0].get_weight() == 5);
    REQUIRE(tests[0].get_spec().get_command() == Command{"./estimate", "train", "data"});

    const auto& staged = tests[0].get_staged_files();
    REQUIRE(staged.size() == 2);
    REQUIRE(staged[0].source == data / "train.1.txt");
    REQUIRE(staged[0].name == "train");
    REQUIRE(staged[1].source == data / "data.1.txt");
    REQUIRE(staged[1].name == "data");
}

TEST_CASE("list_fixtures filters by prefix and suffix") {
    TempDir data;
    data.write("ref.1.txt", "");
    data.write("ref.1.out", "");
    data.write("other.txt", "");
    data.write("ref..txt", "");

    REQUIRE(list_fixtures(data.path(), "ref.", ".txt") == std::vector<std::string>{"ref..txt", "ref.1.txt"});
    REQUIRE_THROWS_AS(list_fixtures(data / "missing", "ref.", ".txt"), ConfigurationError);
}
