#include <autograder/project/project.hpp>

#include <autograder/common/overloaded.hpp>
#include <autograder/compare/text.hpp>
#include <autograder/discovery/discovery.hpp>
#include <autograder/discovery/test_group.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/logging.hpp>
#include <autograder/output/serializer.hpp>
#include <autograder/project/external_command.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace autograder {

namespace {

/// Same scheme kind as `scheme`, with default file names
DiscoveryScheme default_like(const DiscoveryScheme& scheme) {
    return std::visit(Overloaded{
                          [](const TranscriptScheme&) -> DiscoveryScheme { return TranscriptScheme{}; },
                          [](const PairedFileScheme& paired) -> DiscoveryScheme {
                              return PairedFileScheme{.input_mode = paired.input_mode};
                          },
                          [](const StagedFileScheme&) -> DiscoveryScheme { return StagedFileScheme{}; },
                      },
                      scheme);
}

std::vector<std::string> duplicate_ids(const std::vector<TestGroup>& groups) {
    std::map<std::string, int> counts;
    for (const auto& group : groups) {
        ++counts[group.id];
    }

    std::vector<std::string> dups;
    for (const auto& [id, count] : counts) {
        if (count > 1) {
            dups.push_back(id);
        }
    }

    return dups;
}

} // namespace

Project::Project(std::string name, std::vector<TestGroup> groups, std::string program)
    : name_{std::move(name)}
    , program_{program.empty() ? name_ : std::move(program)} {
    if (auto dups = duplicate_ids(groups); !dups.empty()) {
        throw ConfigurationError{fmt::format("Duplicate test group ids for {}: {}", name_, dups)};
    }

    for (auto& group : groups) {
        if (group.weight < 0) {
            throw ConfigurationError{
                fmt::format("Negative weight {} for test group {}", group.weight, group.report_name(name_))};
        }

        if (group.category == Category::Personal) {
            user_groups_.push_back(std::move(group));
        } else {
            groups_.push_back(std::move(group));
        }
    }

    if (groups_.empty()) {
        throw ConfigurationError{fmt::format("Must provide at least one test group for {}", name_)};
    }

    if (user_groups_.empty()) {
        user_groups_.push_back(TestGroup{
            .id = "",
            .scheme = default_like(groups_.front().scheme),
            .category = Category::Personal,
            .name = "0",
        });
    }
}

void Project::set_context(const AssignmentContext& ctx) {
    namespace fs = std::filesystem;

    // Tests run from the build directory, so every root is made absolute
    AssignmentContext abs_ctx{
        .src_dir = fs::absolute(ctx.src_dir).lexically_normal(),
        .build_dir = fs::absolute(ctx.build_dir).lexically_normal(),
        .data_dir = fs::absolute(ctx.data_dir).lexically_normal(),
        .user_dir = std::nullopt,
    };
    abs_ctx.user_dir = ctx.user_dir ? fs::absolute(*ctx.user_dir).lexically_normal() : abs_ctx.src_dir / "tests";

    LOG_DEBUG("Context for {}: src={} build={} data={} user={}", name_, abs_ctx.src_dir.string(),
              abs_ctx.build_dir.string(), abs_ctx.data_dir.string(), abs_ctx.user_dir->string());

    ctx_ = std::move(abs_ctx);
}

const AssignmentContext& Project::context() const {
    ASSERT(ctx_.has_value(), "Project used without context", name_);

    return *ctx_;
}

bool Project::is_requested(const TestGroup& group, const RequestSet& requests) const {
    return requests.empty() || requests.contains(fmt::format("{}:{}", name_, group.get_name()));
}

void Project::gather_group(const TestGroup& group, const std::filesystem::path& data_dir) {
    const DiscoveryContext discovery_ctx{
        .project = name_,
        .program = program_,
        .build_dir = context().build_dir,
        .data_dir = data_dir,
    };

    for (auto& test : discover_tests(group, discovery_ctx)) {
        tests_.push_back(std::move(test));
    }
}

int Project::gather_tests(const RequestSet& requests, Serializer& out) {
    const auto& ctx = context();

    LOG_INFO("Gathering tests for {}", quote(name_));

    tests_.clear();
    ready_ = false;

    if (!std::filesystem::is_directory(ctx.src_dir)) {
        out.on_message(fmt::format("No source found for {}", name_));
        LOG_INFO("Source dir not found: {}", quote(ctx.src_dir.string()));
        return 0;
    }

    if (!std::filesystem::is_directory(ctx.data_dir)) {
        throw ConfigurationError{fmt::format("Data directory not found: {}", quote(ctx.data_dir.string()))};
    }

    // Naming the project requests all of its groups
    static const RequestSet ALL_GROUPS{};
    const RequestSet& filter = requests.contains(name_) ? ALL_GROUPS : requests;

    for (const auto& group : groups_) {
        if (is_requested(group, filter)) {
            gather_group(group, ctx.data_dir);
        }
    }

    if (std::filesystem::is_directory(*ctx.user_dir)) {
        for (const auto& group : user_groups_) {
            if (is_requested(group, filter)) {
                gather_group(group, *ctx.user_dir);
            }
        }
    }

    const auto count = gsl::narrow_cast<int>(tests_.size());
    LOG_INFO("Total tests for {}: {}", name_, count);

    return count;
}

std::string Project::makefile_template(std::string_view src_path) {
    return fmt::format("SRCPATH={}\n"
                       "\n"
                       "vpath %.c $(SRCPATH)\n"
                       "vpath %.h $(SRCPATH)\n"
                       "\n"
                       "include $(SRCPATH)/Makefile\n",
                       src_path);
}

void Project::prepare_build_dir() {
    if (tests_.empty()) {
        return;
    }

    const auto& ctx = context();

    std::filesystem::create_directories(ctx.build_dir);

    const auto makefile = ctx.build_dir / "Makefile";

    if (std::filesystem::exists(makefile)) {
        return;
    }

    LOG_INFO("Creating Makefile: {}", quote(makefile.string()));

    const std::string src_path = ctx.src_dir.lexically_relative(ctx.build_dir).string();

    if (src_path.find(' ') != std::string::npos) {
        throw ConfigurationError{fmt::format("space in path from SRC_DIR to BUILD_DIR {}", quote(src_path))};
    }

    std::ofstream file{makefile};
    file << makefile_template(src_path);

    if (!file) {
        throw ConfigurationError{fmt::format("Unable to write {}", quote(makefile.string()))};
    }
}

int Project::build(Serializer& out) {
    if (tests_.empty()) {
        return 0;
    }

    const auto& ctx = context();

    out.on_status(fmt::format("Building {}.", name_));

    try {
        run_command({"make"}, ctx.build_dir);

        if (!std::filesystem::exists(ctx.build_dir / program_)) {
            throw GraderError{fmt::format("executable not created: {}", program_)};
        }
    } catch (const GraderError& err) {
        LOG_INFO("Build of {} failed: {}", name_, err.what());
        out.on_error(name_, err);
        return 1;
    }

    ready_ = true;
    return 0;
}

std::vector<std::reference_wrapper<TestCase>> Project::tests() {
    if (!ready_) {
        return {};
    }

    return {tests_.begin(), tests_.end()};
}

} // namespace autograder
