#include <autograder/subprocess/process_runner.hpp>
#include <autograder/subprocess/run_result.hpp>
#include <autograder/subprocess/subprocess.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>

using namespace autograder;
using namespace std::chrono_literals;

namespace {

ProcessRequest make_request(std::vector<std::string> args, std::chrono::milliseconds time_limit = 5s,
                            std::size_t output_limit = 1024) {
    return {.args = std::move(args), .working_dir = {}, .time_limit = time_limit, .output_limit = output_limit};
}

} // namespace

TEST_CASE("A well-behaved process completes") {
    auto res = ProcessRunner{}.run(make_request({"/bin/sh", "-c", "echo hello; exit 2"}));

    REQUIRE(res);
    REQUIRE(res->outcome == ProcessOutcome::Completed);
    REQUIRE(res->exit_code == 2);
    REQUIRE(res->output == "hello\n");
    REQUIRE(res->pid > 0);
}

TEST_CASE("A process exceeding its time limit is killed") {
    const auto start = std::chrono::steady_clock::now();

    auto res = ProcessRunner{}.run(make_request({"/bin/sh", "-c", "echo partial; sleep 10"}, 200ms));

    REQUIRE(res);
    REQUIRE(res->outcome == ProcessOutcome::TimedOut);
    REQUIRE(res->output == "partial\n");
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("Children of a timed out process are killed too") {
    // The background sleep holds the output pipe open; only a process group kill closes it
    auto res = ProcessRunner{}.run(make_request({"/bin/sh", "-c", "sleep 10 & sleep 10"}, 200ms));

    REQUIRE(res);
    REQUIRE(res->outcome == ProcessOutcome::TimedOut);
}

TEST_CASE("A process that closes its output and keeps running still times out") {
    const auto start = std::chrono::steady_clock::now();

    auto res = ProcessRunner{}.run(make_request({"/bin/sh", "-c", "exec >&- 2>&-; sleep 10"}, 200ms));

    REQUIRE(res);
    REQUIRE(res->outcome == ProcessOutcome::TimedOut);
    REQUIRE(res->output.empty());
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("Output past the limit is cut off") {
    auto res = ProcessRunner{}.run(make_request({"/bin/sh", "-c", "while :; do echo spam; done"}, 5s, 100));

    REQUIRE(res);
    REQUIRE(res->outcome == ProcessOutcome::OutputLimitExceeded);
    REQUIRE(res->output.size() == 100);
    REQUIRE(res->exit_code == -SIGKILL);
}

TEST_CASE("Output of exactly the limit is accepted") {
    auto res = ProcessRunner{}.run(make_request({"/bin/sh", "-c", "printf 12345"}, 5s, 5));

    REQUIRE(res);
    REQUIRE(res->outcome == ProcessOutcome::Completed);
    REQUIRE(res->output == "12345");
}

TEST_CASE("Input is delivered before stdin is closed") {
    auto res = ProcessRunner{}.run(make_request({"cat"}),
                                   [](Subprocess& proc) { REQUIRE(proc.send_stdin("line one\nline two\n")); });

    REQUIRE(res);
    REQUIRE(res->output == "line one\nline two\n");
    REQUIRE(res->exit_code == 0);
}

TEST_CASE("A throwing input callback still reaps the subject") {
    REQUIRE_THROWS_AS(ProcessRunner{}.run(make_request({"cat"}),
                                          [](Subprocess& /*proc*/) { throw std::runtime_error("no input"); }),
                      std::runtime_error);
}

TEST_CASE("A missing program exits with 127") {
    auto res = ProcessRunner{}.run(make_request({"./no-such-program"}));

    REQUIRE(res);
    REQUIRE(res->exit_code == 127);
}
