#include "app/grader_app.hpp"

#include "common/terminal_checks.hpp"
#include "output/plaintext_serializer.hpp"
#include "test_runner.hpp"
#include "user/program_options.hpp"

#include <autograder/common/linux.hpp>
#include <autograder/compare/text.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/grading_session.hpp>
#include <autograder/logging.hpp>
#include <autograder/project/assignment.hpp>
#include <autograder/project/external_command.hpp>
#include <autograder/registrars/global_registrar.hpp>
#include <autograder/version.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace autograder {

namespace fs = std::filesystem;

GraderApp::GraderApp(ProgramOptions opts)
    : App{std::move(opts)}
    , serializer_{std::make_shared<PlainTextSerializer>(output_sink_, status_sink_, OPTS.colorize_option,
                                                        OPTS.verbosity, in_terminal(stderr))} {}

fs::path GraderApp::get_exe_dir() {
    std::error_code err;
    fs::path exe = fs::read_symlink("/proc/self/exe", err);

    if (err) {
        LOG_WARN("Unable to locate the grader executable: {}", err.message());
        return fs::current_path();
    }

    return exe.parent_path();
}

RegisteredAssignment& GraderApp::select_assignment() const {
    auto& registrar = GlobalRegistrar::get();
    const auto names = registrar.get_assignment_names();

    if (OPTS.assignment_name) {
        if (auto entry = registrar.get_assignment(*OPTS.assignment_name)) {
            return entry->get();
        }
        throw ConfigurationError{fmt::format("unknown assignment {}", quote(*OPTS.assignment_name))};
    }

    if (names.empty()) {
        throw ConfigurationError{"no assignments available"};
    }

    if (names.size() > 1) {
        throw ConfigurationError{fmt::format("choose an assignment with --assignment, one of: {}", names)};
    }

    return registrar.get_assignment(names.front())->get();
}

void GraderApp::grade(RegisteredAssignment& entry, const fs::path& src_dir, const fs::path& build_dir) {
    const AssignmentContext ctx{
        .src_dir = src_dir,
        .build_dir = build_dir,
        .data_dir = OPTS.data_dir.value_or(get_exe_dir() / ProgramOptions::DEFAULT_DATA_SUBDIR),
        .user_dir = std::nullopt,
    };

    const RunOptions run_opts{
        .requests = RequestSet{OPTS.requests.begin(), OPTS.requests.end()},
        .stop_on_failure = OPTS.stop_on_failure,
        .init_only = OPTS.init_only,
    };

    AssignmentRunner runner{entry.get(), serializer_, RunMetadata{entry.get_name(), entry.get_release()}};
    RunSummary summary = runner.run(ctx, run_opts);

    LOG_INFO("Completed {} of {} tests. Failures: {}. Errors: {}.", summary.tally.completed, summary.tally.requested,
             summary.tally.failures, summary.tally.errors);
}

void GraderApp::grade_archive(RegisteredAssignment& entry, const fs::path& archive) {
    if (!fs::is_regular_file(archive)) {
        throw ConfigurationError{fmt::format("archive not found: {}", quote(archive.string()))};
    }

    auto tmp_res = linux::mkdtemp((fs::temp_directory_path() / "autograder-XXXXXX").string());
    if (!tmp_res) {
        throw ConfigurationError{fmt::format("Unable to create a temporary directory: {}", tmp_res.error().message())};
    }

    const fs::path root = tmp_res.value();
    LOG_DEBUG("Extracting {} into {}", quote(archive.string()), quote(root.string()));

    auto cleanup = gsl::finally([&root] {
        std::error_code err;
        fs::remove_all(root, err);

        if (err) {
            LOG_WARN("Unable to remove {}: {}", quote(root.string()), err.message());
        }
    });

    run_command({"tar", "-xf", fs::absolute(archive).string()}, root);

    const fs::path src_dir = root / ProgramOptions::DEFAULT_SRC_DIR;
    const fs::path build_dir = root / ProgramOptions::DEFAULT_BUILD_DIR;

    if (!fs::is_directory(src_dir)) {
        throw ConfigurationError{
            fmt::format("archive does not contain directory {}", quote(ProgramOptions::DEFAULT_SRC_DIR))};
    }

    if (fs::exists(build_dir)) {
        serializer_->on_warning(fmt::format("WARNING: archive contains {}", quote(ProgramOptions::DEFAULT_BUILD_DIR)));
        fs::remove_all(build_dir);
    }

    grade(entry, src_dir, build_dir);
}

int GraderApp::run_impl() {
    auto finalize = gsl::finally([this] { serializer_->finalize(); });

    try {
        RegisteredAssignment& entry = select_assignment();

        LOG_INFO("Starting autograder for {} release {}. Library {}", entry.get_name(), entry.get_release(),
                 AUTOGRADER_VERSION_STRING);

        serializer_->on_run_metadata(RunMetadata{entry.get_name(), entry.get_release()});

        if (OPTS.archive) {
            grade_archive(entry, *OPTS.archive);
            return EXIT_SUCCESS;
        }

        if (!fs::is_directory(OPTS.src_dir)) {
            throw ConfigurationError{fmt::format("invalid src directory: {}", quote(OPTS.src_dir.string()))};
        }

        if (OPTS.fresh && fs::exists(OPTS.build_dir)) {
            LOG_INFO("Removing {}", quote(OPTS.build_dir.string()));
            fs::remove_all(OPTS.build_dir);
        }

        grade(entry, OPTS.src_dir, OPTS.build_dir);
    } catch (const GraderError& err) {
        LOG_ERROR("Run aborted: {}", err.what());
        serializer_->on_error("grader", err);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

} // namespace autograder
